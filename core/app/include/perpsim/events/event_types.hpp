#pragma once

#include "perpsim/domain/decimal.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace perpsim {

// Wall-clock (or simulated) time carried by every event.
using Timestamp = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// TickEvent
// -----------------------------------------------------------------------------
// Responsibility: One accepted price observation. Published by the tick loop
// at the start of every processed tick, after the price source returned a
// usable value. Skipped ticks (malformed feed messages) publish nothing.
// -----------------------------------------------------------------------------
struct TickEvent {
  std::string symbol;
  Decimal price{0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};  // Tick counter, starts at 1
};

}  // namespace perpsim

#pragma once

#include <cstdint>

namespace perpsim {

// -----------------------------------------------------------------------------
// ITimeProvider - source of "now" for snapshots and events
// -----------------------------------------------------------------------------
//
// @brief  Milliseconds since the Unix epoch, injected into TickLoop.
//
// @details
// The live binary stamps every tick with wall-clock time. Tests inject a
// SimulationTimeProvider and set the clock explicitly, so snapshot
// timestamps and the HH:MM:SS field are deterministic.
//
//   LiveTimeProvider        std::chrono::system_clock
//   SimulationTimeProvider  value set by advance_time()
//
// Thread-safety contract:
//   now_ms() must be safe to call concurrently. The IPC thread reads it
//   while the tick thread does.
//
// Ownership:
//   Components hold a const reference; the provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Epoch milliseconds. A SimulationTimeProvider returns 0 until advanced.
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace perpsim

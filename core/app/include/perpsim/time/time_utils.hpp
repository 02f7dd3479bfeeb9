#pragma once

#include "perpsim/events/event_types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace perpsim {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Bridges ITimeProvider's epoch milliseconds and the Timestamp
//         (system_clock::time_point) carried by events.
// -----------------------------------------------------------------------------

inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// -------------------------------------------------------------------------
// format_clock(ms, utc)
// -------------------------------------------------------------------------
// @brief  "HH:MM:SS" wall-clock text for the snapshot's time field.
//
// @param  utc  false formats in the process's local time zone (what a
//              status client watching the terminal expects); true is used
//              by tests for a zone-independent result.
//
// @throws std::runtime_error if the C library cannot break the time down.
// -------------------------------------------------------------------------
std::string format_clock(std::int64_t ms, bool utc = false);

}  // namespace perpsim

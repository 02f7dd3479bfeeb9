#pragma once

#include "perpsim/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace perpsim {

// -----------------------------------------------------------------------------
// SimulationTimeProvider - clock driven by the caller
// -----------------------------------------------------------------------------
//
// @brief  Returns whatever advance_time() last stored.
//
// @details
// Used by the tick loop tests and by replay setups that feed recorded ticks
// through a ZmqPriceFeed. Monotonicity is the caller's job; any value may be
// stored, which lets tests jump the clock freely.
//
// Thread model:
//   One writer, any number of readers. The value is a std::atomic, so
//   neither side takes a lock.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms and returns the new time.
  std::int64_t advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace perpsim

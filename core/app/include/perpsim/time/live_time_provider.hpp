#pragma once

#include "perpsim/time/i_time_provider.hpp"

namespace perpsim {

// Wall-clock ITimeProvider backed by std::chrono::system_clock. Stateless,
// safe from any thread.
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace perpsim

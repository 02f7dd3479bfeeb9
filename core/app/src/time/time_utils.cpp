#include "perpsim/time/time_utils.hpp"

#include <ctime>
#include <stdexcept>

namespace perpsim {

std::string format_clock(std::int64_t ms, bool utc) {
  const std::time_t seconds = static_cast<std::time_t>(ms / 1000);
  std::tm parts{};
  // The _r variants write into our tm; the IPC thread formats concurrently.
  const std::tm* ok = utc ? gmtime_r(&seconds, &parts)
                          : localtime_r(&seconds, &parts);
  if (ok == nullptr) {
    throw std::runtime_error("format_clock: time out of range");
  }
  char buffer[16];
  const std::size_t n = std::strftime(buffer, sizeof(buffer), "%H:%M:%S", &parts);
  return std::string(buffer, n);
}

}  // namespace perpsim

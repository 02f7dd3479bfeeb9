#include "perpsim/snapshot/snapshot_store.hpp"

namespace perpsim {

void SnapshotStore::publish(const domain::AccountSnapshot& snapshot) {
  std::lock_guard<std::mutex> lock(mutex_);
  latest_ = snapshot;
  ++published_;
}

std::optional<domain::AccountSnapshot> SnapshotStore::latest() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return latest_;
}

std::uint64_t SnapshotStore::publishedCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return published_;
}

}  // namespace perpsim

#pragma once

#include "perpsim/snapshot/i_snapshot_sink.hpp"

#include <cstdint>
#include <mutex>
#include <optional>

namespace perpsim {

// -----------------------------------------------------------------------------
// SnapshotStore - latest snapshot, readable from any thread
// -----------------------------------------------------------------------------
// Responsibility: Keeps a copy of the most recent snapshot so that the IPC
// thread can answer status queries without touching engine state.
//
// Thread model: publish() on the tick thread; latest() from any thread.
// Both take the same mutex; a reader gets a copy.
// -----------------------------------------------------------------------------
class SnapshotStore final : public ISnapshotSink {
 public:
  void publish(const domain::AccountSnapshot& snapshot) override;

  // std::nullopt until the first tick has been processed.
  std::optional<domain::AccountSnapshot> latest() const;

  std::uint64_t publishedCount() const;

 private:
  mutable std::mutex mutex_;
  std::optional<domain::AccountSnapshot> latest_;
  std::uint64_t published_{0};
};

}  // namespace perpsim

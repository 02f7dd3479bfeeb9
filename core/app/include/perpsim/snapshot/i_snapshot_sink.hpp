#pragma once

#include "perpsim/domain/account_snapshot.hpp"

namespace perpsim {

// -----------------------------------------------------------------------------
// ISnapshotSink - where the once-per-tick state goes
// -----------------------------------------------------------------------------
//
// @brief  TickLoop hands every snapshot to each registered sink in
//         registration order.
//
// @details
// A sink may throw (disk full, serialization failure). The tick loop logs
// the exception and carries on with the next sink and the next tick; the
// engine state is already committed by then.
//
// Implementations:
//   SnapshotStore            latest snapshot in memory, for IPC queries
//   JsonFileSnapshotWriter   state file overwritten atomically each tick
//
// Thread model: publish() is called on the tick thread.
// -----------------------------------------------------------------------------
class ISnapshotSink {
 public:
  virtual ~ISnapshotSink() = default;

  virtual void publish(const domain::AccountSnapshot& snapshot) = 0;
};

}  // namespace perpsim

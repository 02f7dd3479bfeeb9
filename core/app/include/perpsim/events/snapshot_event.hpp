#pragma once

#include "perpsim/domain/account_snapshot.hpp"

namespace perpsim {

// Full account snapshot, published at the end of every processed tick.
struct SnapshotEvent {
  domain::AccountSnapshot snapshot;
};

}  // namespace perpsim

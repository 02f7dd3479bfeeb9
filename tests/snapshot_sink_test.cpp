// =============================================================================
// snapshot_sink_test.cpp
// =============================================================================
// Unit tests for the snapshot sinks and the clock formatting they rely on.
//
// Validates:
//   - SnapshotStore starts empty, keeps only the latest snapshot
//   - JsonFileSnapshotWriter replaces the file on every publish and leaves
//     no temp file behind
//   - Unwritable paths throw std::runtime_error
//   - format_clock() renders HH:MM:SS
// =============================================================================

#include "perpsim/network/json_codec.hpp"
#include "perpsim/snapshot/json_file_snapshot_writer.hpp"
#include "perpsim/snapshot/snapshot_store.hpp"
#include "perpsim/time/simulation_time_provider.hpp"
#include "perpsim/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>

using perpsim::parseDecimal;

class SnapshotSinkTest : public ::testing::Test {
 protected:
  void TearDown() override {
    std::remove(path_.c_str());
    std::remove((path_ + ".tmp").c_str());
  }

  static perpsim::domain::AccountSnapshot snapshotAt(const char* price) {
    perpsim::domain::AccountSnapshot s;
    s.symbol = "BTCUSDT";
    s.price = parseDecimal(price);
    s.balance = 1000;
    s.total_value = 1000;
    return s;
  }

  static nlohmann::json readFile(const std::string& path) {
    std::ifstream in(path);
    return nlohmann::json::parse(in);
  }

  std::string path_ = ::testing::TempDir() + "perpsim_snapshot_test.json";
};

// -----------------------------------------------------------------------------
// 1. In-memory store.
// -----------------------------------------------------------------------------
TEST_F(SnapshotSinkTest, StoreKeepsLatest) {
  perpsim::SnapshotStore store;
  EXPECT_FALSE(store.latest().has_value());
  EXPECT_EQ(store.publishedCount(), 0u);

  store.publish(snapshotAt("100"));
  store.publish(snapshotAt("101.5"));

  auto latest = store.latest();
  ASSERT_TRUE(latest.has_value());
  EXPECT_EQ(latest->price, parseDecimal("101.5"));
  EXPECT_EQ(store.publishedCount(), 2u);
}

// -----------------------------------------------------------------------------
// 2. State file is fully replaced each tick.
// Why: readers poll the file; stale keys from a previous document would
//      describe a position that no longer exists.
// -----------------------------------------------------------------------------
TEST_F(SnapshotSinkTest, FileWriterReplacesDocument) {
  perpsim::JsonFileSnapshotWriter writer(path_);

  auto with_position = snapshotAt("100");
  perpsim::domain::PositionSnapshot p;
  p.side = perpsim::domain::PositionSide::Long;
  p.quantity = 1;
  p.entry_price = 100;
  with_position.position = p;
  writer.publish(with_position);
  EXPECT_EQ(readFile(path_).at("position").at("side"), "Long");

  writer.publish(snapshotAt("101"));
  const auto doc = readFile(path_);
  EXPECT_DOUBLE_EQ(doc.at("price").get<double>(), 101.0);
  EXPECT_TRUE(doc.at("position").empty());

  std::ifstream tmp(path_ + ".tmp");
  EXPECT_FALSE(tmp.good());
}

TEST_F(SnapshotSinkTest, FileWriterErrors) {
  EXPECT_THROW(perpsim::JsonFileSnapshotWriter(""), std::invalid_argument);

  perpsim::JsonFileSnapshotWriter writer("/nonexistent-dir/perpsim.json");
  EXPECT_THROW(writer.publish(snapshotAt("100")), std::runtime_error);
}

// -----------------------------------------------------------------------------
// 3. Clock text and the simulation clock.
// -----------------------------------------------------------------------------
TEST_F(SnapshotSinkTest, ClockFormatting) {
  // 2023-11-14T22:13:20Z
  EXPECT_EQ(perpsim::format_clock(1700000000000, true), "22:13:20");
  EXPECT_EQ(perpsim::format_clock(0, true), "00:00:00");
  EXPECT_EQ(perpsim::format_clock(1700000000999, true), "22:13:20");

  perpsim::SimulationTimeProvider clock(1000);
  EXPECT_EQ(clock.now_ms(), 1000);
  EXPECT_EQ(clock.advance_by(500), 1500);
  clock.advance_time(42);
  EXPECT_EQ(clock.now_ms(), 42);
  EXPECT_EQ(perpsim::timestamp_to_ms(perpsim::ms_to_timestamp(1234)), 1234);
}

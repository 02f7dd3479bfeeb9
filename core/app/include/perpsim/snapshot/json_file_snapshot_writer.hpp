#pragma once

#include "perpsim/snapshot/i_snapshot_sink.hpp"

#include <string>

namespace perpsim {

// -----------------------------------------------------------------------------
// JsonFileSnapshotWriter - state file for external readers
// -----------------------------------------------------------------------------
//
// @brief  Writes every snapshot as a JSON document (see json_codec.hpp) to
//         a fixed path, fully replacing the previous contents.
//
// @details
// The document is written to "<path>.tmp" and then renamed over <path>.
// rename() is atomic on POSIX file systems, so a reader polling the file
// never sees a half-written document.
//
// @throws std::runtime_error from publish() if the temp file cannot be
//         written or the rename fails.
// -----------------------------------------------------------------------------
class JsonFileSnapshotWriter final : public ISnapshotSink {
 public:
  explicit JsonFileSnapshotWriter(std::string path);

  void publish(const domain::AccountSnapshot& snapshot) override;

  const std::string& path() const { return path_; }

 private:
  std::string path_;
  std::string tmp_path_;
};

}  // namespace perpsim

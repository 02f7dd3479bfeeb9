#include "perpsim/snapshot/json_file_snapshot_writer.hpp"

#include "perpsim/network/json_codec.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <stdexcept>

namespace perpsim {

JsonFileSnapshotWriter::JsonFileSnapshotWriter(std::string path)
    : path_(std::move(path)), tmp_path_(path_ + ".tmp") {
  if (path_.empty()) {
    throw std::invalid_argument("snapshot path must not be empty");
  }
}

void JsonFileSnapshotWriter::publish(const domain::AccountSnapshot& snapshot) {
  const std::string document = toJson(snapshot).dump(2);

  {
    std::ofstream out(tmp_path_, std::ios::out | std::ios::trunc);
    if (!out) {
      throw std::runtime_error("cannot open " + tmp_path_);
    }
    out << document << "\n";
    out.flush();
    if (!out) {
      throw std::runtime_error("write failed: " + tmp_path_);
    }
  }

  if (std::rename(tmp_path_.c_str(), path_.c_str()) != 0) {
    throw std::runtime_error("rename " + tmp_path_ + " -> " + path_ +
                             " failed: " + std::strerror(errno));
  }
}

}  // namespace perpsim

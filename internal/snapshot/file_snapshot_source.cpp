#include "file_snapshot_source.hpp"

#include <fstream>
#include <sstream>

#include "internal/snapshot/snapshot_parser.hpp"
#include "internal/util/errors.hpp"

namespace pwaudit::snapshot {

FileSnapshotSource::FileSnapshotSource(std::filesystem::path path) : path_(std::move(path)) {
}

graph::GraphSnapshot FileSnapshotSource::Acquire() {
  std::ifstream in(path_, std::ios::binary);
  if (!in) {
    throw util::SnapshotUnavailable("Failed to open dump file: " + path_.string());
  }

  std::ostringstream contents;
  contents << in.rdbuf();
  if (in.bad()) {
    throw util::SnapshotUnavailable("Failed to read dump file: " + path_.string());
  }

  return ParseSnapshot(contents.str());
}

std::string FileSnapshotSource::Describe() const {
  return "file '" + path_.string() + "'";
}

} // namespace pwaudit::snapshot

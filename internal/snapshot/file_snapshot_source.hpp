#pragma once

#include <filesystem>
#include <string>

#include "snapshot_source.hpp"

namespace pwaudit::snapshot {

/*
  Reads a dump previously captured with `pw-dump > file.json`.
*/
class FileSnapshotSource : public SnapshotSource {
 public:
  explicit FileSnapshotSource(std::filesystem::path path);

  graph::GraphSnapshot Acquire() override;
  std::string          Describe() const override;

 private:
  std::filesystem::path path_;
};

} // namespace pwaudit::snapshot

#pragma once

#include <string>

#include "snapshot_source.hpp"

namespace pwaudit::snapshot {

inline constexpr char kDefaultDumpCommand[] = "pw-dump";

/*
  Runs a shell command and parses its stdout.

  A command that cannot be started or exits non-zero is reported as
  SnapshotUnavailable. The child's stderr is left attached to ours.
*/
class CommandSnapshotSource : public SnapshotSource {
 public:
  explicit CommandSnapshotSource(std::string command = kDefaultDumpCommand);

  graph::GraphSnapshot Acquire() override;
  std::string          Describe() const override;

 private:
  std::string RunCommand() const;

  std::string command_;
};

} // namespace pwaudit::snapshot

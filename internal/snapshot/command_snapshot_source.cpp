#include "command_snapshot_source.hpp"

#include <sys/wait.h>

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>

#include "internal/observability/logging.hpp"
#include "internal/snapshot/snapshot_parser.hpp"
#include "internal/util/errors.hpp"

namespace pwaudit::snapshot {

using pwaudit::util::SnapshotUnavailable;

CommandSnapshotSource::CommandSnapshotSource(std::string command) : command_(std::move(command)) {
}

graph::GraphSnapshot CommandSnapshotSource::Acquire() {
  PWAUDIT_LOG_DEBUG("Running snapshot command", {observability::StringField("command", command_)});
  return ParseSnapshot(RunCommand());
}

std::string CommandSnapshotSource::Describe() const {
  return "command '" + command_ + "'";
}

std::string CommandSnapshotSource::RunCommand() const {
  FILE* pipe = ::popen(command_.c_str(), "r");
  if (pipe == nullptr) {
    throw SnapshotUnavailable("Failed to start '" + command_ + "': " + std::strerror(errno));
  }

  std::string           output;
  std::array<char, 8192> chunk{};
  while (true) {
    const auto n = std::fread(chunk.data(), 1, chunk.size(), pipe);
    output.append(chunk.data(), n);
    if (n < chunk.size()) {
      break;
    }
  }
  const bool read_error = std::ferror(pipe) != 0;

  const int status = ::pclose(pipe);
  if (status == -1) {
    throw SnapshotUnavailable("Failed to wait for '" + command_ + "': " + std::strerror(errno));
  }
  if (read_error) {
    throw SnapshotUnavailable("Failed to read output of '" + command_ + "'");
  }
  if (!WIFEXITED(status)) {
    throw SnapshotUnavailable("'" + command_ + "' terminated abnormally");
  }
  if (WEXITSTATUS(status) != 0) {
    throw SnapshotUnavailable("'" + command_ + "' exited with status " + std::to_string(WEXITSTATUS(status)));
  }

  return output;
}

} // namespace pwaudit::snapshot

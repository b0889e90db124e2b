#include "snapshot_factory.hpp"

#include <memory>

#include "command_snapshot_source.hpp"
#include "file_snapshot_source.hpp"

namespace pwaudit::snapshot {

SnapshotSourcePtr SnapshotFactory::Build(const pwaudit::runtime::config::SnapshotConfig& cfg) {
  if (!cfg.dump_file().empty()) {
    return std::make_unique<FileSnapshotSource>(cfg.dump_file());
  }

  const auto& command = cfg.command().empty() ? std::string(kDefaultDumpCommand) : cfg.command();
  return std::make_unique<CommandSnapshotSource>(command);
}

} // namespace pwaudit::snapshot

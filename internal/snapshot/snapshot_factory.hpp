#pragma once

#include "snapshot_source.hpp"
#include "config/config.pb.h"

namespace pwaudit::snapshot {

/*
  Picks the snapshot source from configuration: a dump file when one is
  configured, otherwise the dump command (pw-dump by default).
*/

class SnapshotFactory {
 public:
  static SnapshotSourcePtr Build(const pwaudit::runtime::config::SnapshotConfig& cfg);
};

} // namespace pwaudit::snapshot

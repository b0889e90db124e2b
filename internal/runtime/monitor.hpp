#pragma once

#include <string>
#include <string_view>

#include "config/config.pb.h"
#include "internal/audit/decision_engine.hpp"
#include "internal/render/status_formatter.hpp"
#include "internal/snapshot/snapshot_source.hpp"

namespace pwaudit::runtime {

/*
  One panel refresh: acquire a snapshot, audit the target, render the line.

  Holds no state between calls; every Run() takes a fresh snapshot.
*/
class Monitor {
 public:
  Monitor(snapshot::SnapshotSourcePtr source, render::StatusFormatter formatter);

  // Composition root: source and formatter from configuration.
  static Monitor FromConfig(const pwaudit::runtime::config::RuntimeConfig& config);

  audit::AuditResult Audit(std::string_view target_substring);

  std::string Run(std::string_view target_substring);

 private:
  snapshot::SnapshotSourcePtr source_;
  render::StatusFormatter     formatter_;
};

} // namespace pwaudit::runtime

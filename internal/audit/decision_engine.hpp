#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "internal/audit/diagnostic_log.hpp"
#include "internal/graph/graph_view.hpp"
#include "internal/model/outcome.hpp"

namespace pwaudit::snapshot {
class SnapshotSource;
}

namespace pwaudit::audit {

struct AuditResult {
  model::Outcome outcome = model::Outcome::kError;

  // Target sample rate; only set for Outcome::kConsistent.
  std::optional<std::uint32_t> rate;

  DiagnosticLog log;
};

/*
  Classifies a target device against its running upstream source.

  Checks run in fixed priority and stop at the first terminal outcome:
    device lookup → target rate → target volume → source count →
    source volume → rate comparison → consistent.
*/
class DecisionEngine {
 public:
  static AuditResult Evaluate(const graph::GraphView& view, std::string_view target_substring);

  // Acquires a snapshot first; acquisition or parse failures and empty
  // snapshots become Outcome::kError.
  static AuditResult Run(snapshot::SnapshotSource& source, std::string_view target_substring);

  // First node, in snapshot order, whose node.name contains target_substring.
  static const graph::Node* FindTarget(const graph::GraphView& view, std::string_view target_substring);

 private:
  // Appends to result.log so acquisition narration stays ahead of evaluation.
  static AuditResult Classify(const graph::GraphView& view, std::string_view target_substring, AuditResult result);
};

} // namespace pwaudit::audit

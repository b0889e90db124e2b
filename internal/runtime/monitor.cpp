#include "monitor.hpp"

#include "internal/observability/logging.hpp"
#include "internal/snapshot/snapshot_factory.hpp"

namespace pwaudit::runtime {

Monitor::Monitor(snapshot::SnapshotSourcePtr source, render::StatusFormatter formatter)
    : source_(std::move(source)), formatter_(std::move(formatter)) {
}

Monitor Monitor::FromConfig(const pwaudit::runtime::config::RuntimeConfig& config) {
  return Monitor(snapshot::SnapshotFactory::Build(config.snapshot()), render::StatusFormatter(config.display()));
}

audit::AuditResult Monitor::Audit(std::string_view target_substring) {
  auto result = audit::DecisionEngine::Run(*source_, target_substring);
  PWAUDIT_LOG_DEBUG("Audit finished", {observability::StringField("outcome", model::ToString(result.outcome)),
                                        observability::BoolField("failure", model::IsFailure(result.outcome)),
                                        observability::StringField("target", target_substring)});
  return result;
}

std::string Monitor::Run(std::string_view target_substring) {
  return formatter_.Format(Audit(target_substring));
}

} // namespace pwaudit::runtime

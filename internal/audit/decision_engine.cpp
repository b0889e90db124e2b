#include "internal/audit/decision_engine.hpp"

#include <string>

#include "internal/attributes/attribute_resolver.hpp"
#include "internal/snapshot/snapshot_source.hpp"
#include "internal/topology/source_filter.hpp"
#include "internal/topology/topology_resolver.hpp"
#include "internal/util/errors.hpp"

namespace pwaudit::audit {

using model::Outcome;
using observability::IntField;
using observability::StringField;

namespace {

std::string RateText(const std::optional<std::uint32_t>& rate) {
  return rate ? std::to_string(*rate) : "unknown";
}

AuditResult Finish(AuditResult& result, Outcome outcome) {
  result.outcome = outcome;
  return std::move(result);
}

void LogVolumeFailure(DiagnosticLog& log, const attributes::VolumeAssessment& volume) {
  log.Add("Volume is not 100% for '" + volume.node_name + "' (ID: " + std::to_string(volume.node_id) + ") (" +
              volume.field + ": " + volume.offending_value + ")",
          {IntField("node_id", volume.node_id), StringField("field", volume.field), StringField("value", volume.offending_value)});
}

} // namespace

// ------------------------------------------------------------
// Target lookup
// ------------------------------------------------------------

const graph::Node* DecisionEngine::FindTarget(const graph::GraphView& view, std::string_view target_substring) {
  for (const auto& node : view.Nodes()) {
    if (attributes::InternalName(node).find(target_substring) != std::string::npos) {
      return &node;
    }
  }
  return nullptr;
}

// ------------------------------------------------------------
// Evaluate
// ------------------------------------------------------------

AuditResult DecisionEngine::Evaluate(const graph::GraphView& view, std::string_view target_substring) {
  return Classify(view, target_substring, AuditResult{});
}

AuditResult DecisionEngine::Classify(const graph::GraphView& view, std::string_view target_substring, AuditResult result) {
  auto& log = result.log;

  log.Add("-> Searching for device: '" + std::string(target_substring) + "'");
  const auto* target = FindTarget(view, target_substring);
  if (target == nullptr) {
    log.Add("Device not found.");
    return Finish(result, Outcome::kDeviceNotFound);
  }
  log.Add("Device found.", {IntField("node_id", target->id), StringField("node_name", attributes::InternalName(*target))});

  const auto target_rate = attributes::SampleRate(*target);
  if (!target_rate) {
    log.Add("Could not determine sample rate for the target device.", {IntField("node_id", target->id)});
    return Finish(result, Outcome::kError);
  }

  const auto target_volume = attributes::AssessVolume(*target);
  if (!target_volume) {
    LogVolumeFailure(log, target_volume);
    return Finish(result, Outcome::kVolumeMismatch);
  }

  log.Add("-> Finding sources connected to device ID " + std::to_string(target->id));
  const auto upstream = topology::ConnectedUpstreamNodes(view, target->id);

  log.Add("-> Filtering sources...");
  const auto filtered = topology::FilterRunning(upstream);
  for (const auto& excluded : filtered.excluded) {
    log.Add("-> Filtering out non-running source: " + excluded.name + " (state: " + excluded.state + ")",
            {IntField("node_id", excluded.node->id), StringField("state", excluded.state)});
  }

  if (filtered.running.empty()) {
    log.Add("Device is idle (no relevant sources connected).");
    return Finish(result, Outcome::kIdle);
  }

  if (filtered.running.size() > 1) {
    log.Add("Device has " + std::to_string(filtered.running.size()) + " active sources. Skipping detailed check.");
    return Finish(result, Outcome::kAmbiguousSources);
  }

  const auto& source = *filtered.running.front();
  log.Add("Found 1 relevant source.");

  const auto source_volume = attributes::AssessVolume(source);
  if (!source_volume) {
    LogVolumeFailure(log, source_volume);
    return Finish(result, Outcome::kVolumeMismatch);
  }

  const auto source_rate = attributes::SampleRate(source);
  log.Add("-> Checking source '" + attributes::DescriptiveName(source) + "' (ID: " + std::to_string(source.id) +
              "): Device rate is " + RateText(target_rate) + ", Source rate is " + RateText(source_rate),
          {IntField("source_id", source.id)});

  // An unknown source rate is not evidence of a mismatch.
  if (source_rate && *source_rate != *target_rate) {
    log.Add("Mismatch found! Device(" + RateText(target_rate) + ") != Source(" + RateText(source_rate) + ")");
    return Finish(result, Outcome::kRateMismatch);
  }

  log.Add("All source sample rates match the device rate.");
  result.rate = target_rate;
  return Finish(result, Outcome::kConsistent);
}

// ------------------------------------------------------------
// Run
// ------------------------------------------------------------

AuditResult DecisionEngine::Run(snapshot::SnapshotSource& source, std::string_view target_substring) {
  AuditResult result;
  result.log.Add("-> Acquiring PipeWire graph from " + source.Describe() + "...");

  graph::GraphSnapshot snapshot;
  try {
    snapshot = source.Acquire();
  } catch (const util::SnapshotUnavailable& e) {
    result.log.Add(std::string("Error getting PipeWire graph: ") + e.what());
    return Finish(result, Outcome::kError);
  } catch (const util::SnapshotParseError& e) {
    result.log.Add(std::string("Error parsing PipeWire graph: ") + e.what());
    return Finish(result, Outcome::kError);
  }

  if (snapshot.values_size() == 0) {
    result.log.Add("PipeWire graph is empty.");
    return Finish(result, Outcome::kError);
  }

  const auto view = graph::GraphView::Build(snapshot);
  return Classify(view, target_substring, std::move(result));
}

} // namespace pwaudit::audit

#pragma once

#include <string_view>

#include "internal/graph/graph_view.hpp"

namespace pwaudit::snapshot {

// pw-dump JSON text to a snapshot. Throws util::SnapshotParseError.
graph::GraphSnapshot ParseSnapshot(std::string_view json);

} // namespace pwaudit::snapshot

#pragma once

#include <memory>
#include <string>

#include "internal/graph/graph_view.hpp"

namespace pwaudit::snapshot {

/*
  Where a graph snapshot comes from.

  Implementations:
    CommandSnapshotSource → runs pw-dump (or a configured command)
    FileSnapshotSource    → reads a previously captured dump
*/

class SnapshotSource {
 public:
  virtual ~SnapshotSource() = default;

  // ------------------------------------------------------------------
  // Acquire
  // ------------------------------------------------------------------
  /*
    Capture and parse one snapshot.

    Throws util::SnapshotUnavailable when the dump cannot be obtained and
    util::SnapshotParseError when it is not a JSON array.
  */
  virtual graph::GraphSnapshot Acquire() = 0;

  // Human-readable origin for diagnostics ("command 'pw-dump'").
  virtual std::string Describe() const = 0;
};

using SnapshotSourcePtr = std::unique_ptr<SnapshotSource>;

} // namespace pwaudit::snapshot

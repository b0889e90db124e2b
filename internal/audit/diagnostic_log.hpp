#pragma once

#include <initializer_list>
#include <string>
#include <vector>

#include "internal/observability/logging.hpp"

namespace pwaudit::audit {

/*
  Ordered narration of one audit, returned alongside the outcome and shown
  as the status tooltip. Each line is also mirrored to the process logger
  together with its structured fields; the fields are not kept here.
*/
class DiagnosticLog {
 public:
  void Add(std::string line, std::initializer_list<observability::LogField> fields = {});

  const std::vector<std::string>& Lines() const {
    return lines_;
  }

  // Lines joined with '\n', no trailing newline.
  std::string Join() const;

 private:
  std::vector<std::string> lines_;
};

} // namespace pwaudit::audit

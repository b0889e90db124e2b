#include "internal/audit/diagnostic_log.hpp"

namespace pwaudit::audit {

void DiagnosticLog::Add(std::string line, std::initializer_list<observability::LogField> fields) {
  PWAUDIT_LOG_INFO(line, fields);
  lines_.push_back(std::move(line));
}

std::string DiagnosticLog::Join() const {
  std::string joined;
  for (const auto& line : lines_) {
    if (!joined.empty()) {
      joined.push_back('\n');
    }
    joined += line;
  }
  return joined;
}

} // namespace pwaudit::audit

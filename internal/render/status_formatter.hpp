#pragma once

#include <string>
#include <string_view>

#include "config/config.pb.h"
#include "internal/audit/decision_engine.hpp"

namespace pwaudit::render {

inline constexpr char kDefaultErrorColor[]  = "Red";
inline constexpr char kDefaultNormalColor[] = "White";

/*
  Renders an audit for the XFCE Generic Monitor applet:

    <txt><span color='Red'>Freq Err</span></txt><tool>...</tool>

  The tooltip is the diagnostic log with markup characters escaped.
*/
class StatusFormatter {
 public:
  StatusFormatter();
  explicit StatusFormatter(const pwaudit::runtime::config::DisplayConfig& cfg);

  std::string Format(const audit::AuditResult& result) const;

  // Panel label for an outcome ("Freq Err", "Idle", the rate for Consistent, ...).
  static std::string StatusText(const audit::AuditResult& result);

  // Escapes &, < and >. Ill-formed UTF-8 bytes become U+FFFD.
  static std::string EscapeMarkup(std::string_view text);

 private:
  std::string error_color_;
  std::string normal_color_;
  bool        show_tooltip_ = true;
};

} // namespace pwaudit::render

#include "internal/render/status_formatter.hpp"

namespace pwaudit::render {

using model::Outcome;

namespace {

std::string Trim(std::string_view text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(" \t\r\n");
  return std::string(text.substr(first, last - first + 1));
}

constexpr char kReplacementCharacter[] = "\xEF\xBF\xBD";

// Length of the well-formed UTF-8 sequence starting at text[pos], 0 when ill-formed.
std::size_t Utf8SequenceLength(std::string_view text, std::size_t pos) {
  const auto lead = static_cast<unsigned char>(text[pos]);

  std::size_t   length = 0;
  unsigned char low    = 0x80;
  unsigned char high   = 0xBF;
  if (lead >= 0xC2 && lead <= 0xDF) {
    length = 2;
  } else if (lead >= 0xE0 && lead <= 0xEF) {
    length = 3;
    if (lead == 0xE0) {
      low = 0xA0;
    } else if (lead == 0xED) {
      high = 0x9F;
    }
  } else if (lead >= 0xF0 && lead <= 0xF4) {
    length = 4;
    if (lead == 0xF0) {
      low = 0x90;
    } else if (lead == 0xF4) {
      high = 0x8F;
    }
  } else {
    return 0;
  }

  if (pos + length > text.size()) {
    return 0;
  }
  for (std::size_t i = 1; i < length; ++i) {
    const auto c = static_cast<unsigned char>(text[pos + i]);
    if (c < low || c > high) {
      return 0;
    }
    low  = 0x80;
    high = 0xBF;
  }
  return length;
}

} // namespace

StatusFormatter::StatusFormatter() : error_color_(kDefaultErrorColor), normal_color_(kDefaultNormalColor) {
}

StatusFormatter::StatusFormatter(const pwaudit::runtime::config::DisplayConfig& cfg) : StatusFormatter() {
  if (!cfg.error_color().empty()) {
    error_color_ = cfg.error_color();
  }
  if (!cfg.normal_color().empty()) {
    normal_color_ = cfg.normal_color();
  }
  if (cfg.has_show_tooltip()) {
    show_tooltip_ = cfg.show_tooltip();
  }
}

std::string StatusFormatter::StatusText(const audit::AuditResult& result) {
  switch (result.outcome) {
    case Outcome::kDeviceNotFound:
      return "N/A";
    case Outcome::kVolumeMismatch:
      return "Vol Err";
    case Outcome::kAmbiguousSources:
      return "Src Err";
    case Outcome::kIdle:
      return "Idle";
    case Outcome::kRateMismatch:
      return "Freq Err";
    case Outcome::kConsistent:
      if (result.rate) {
        return std::to_string(*result.rate);
      }
      return "Err";
    case Outcome::kError:
    default:
      return "Err";
  }
}

std::string StatusFormatter::EscapeMarkup(std::string_view text) {
  std::string escaped;
  escaped.reserve(text.size());
  for (std::size_t pos = 0; pos < text.size();) {
    const char c = text[pos];
    if (static_cast<unsigned char>(c) >= 0x80) {
      const auto length = Utf8SequenceLength(text, pos);
      if (length == 0) {
        escaped += kReplacementCharacter;
        ++pos;
      } else {
        escaped.append(text.substr(pos, length));
        pos += length;
      }
      continue;
    }

    switch (c) {
      case '&':
        escaped += "&amp;";
        break;
      case '<':
        escaped += "&lt;";
        break;
      case '>':
        escaped += "&gt;";
        break;
      default:
        escaped.push_back(c);
    }
    ++pos;
  }
  return escaped;
}

std::string StatusFormatter::Format(const audit::AuditResult& result) const {
  const auto& color = model::IsFailure(result.outcome) ? error_color_ : normal_color_;

  std::string out = "<txt><span color='" + color + "'>" + EscapeMarkup(StatusText(result)) + "</span></txt>";
  if (show_tooltip_) {
    out += "<tool>" + EscapeMarkup(Trim(result.log.Join())) + "</tool>";
  }
  return out;
}

} // namespace pwaudit::render

#pragma once

#include <cstdint>
#include <optional>
#include <variant>

namespace pwaudit::model {

/*
  Shapes a "rate" value takes inside a format parameter object.

    "rate": 48000                                    -> DirectRate
    "rate": { "default": 48000, "min": 1, "max": N } -> RangeRate
*/

struct DirectRate {
  std::int64_t value = 0;
};

struct RangeRate {
  std::optional<std::int64_t> default_value;
};

// monostate: absent or not a recognised shape.
using RateEncoding = std::variant<std::monostate, DirectRate, RangeRate>;

/*
  Where the rate sits inside a format parameter object.

    { "mediaType": "audio", "audio": { "rate": ... } }  -> NestedUnderAudio
    { "mediaType": "audio", "rate": ... }               -> TopLevel
*/

struct NestedUnderAudio {
  RateEncoding rate;
};

struct TopLevel {
  RateEncoding rate;
};

using FormatLocation = std::variant<NestedUnderAudio, TopLevel>;

inline std::optional<std::uint32_t> ResolveRate(const RateEncoding& encoding) {
  std::optional<std::int64_t> raw;
  if (const auto* direct = std::get_if<DirectRate>(&encoding)) {
    raw = direct->value;
  } else if (const auto* range = std::get_if<RangeRate>(&encoding)) {
    raw = range->default_value;
  }

  if (!raw || *raw <= 0 || *raw > UINT32_MAX) {
    return std::nullopt;
  }
  return static_cast<std::uint32_t>(*raw);
}

inline std::optional<std::uint32_t> ResolveRate(const FormatLocation& location) {
  return std::visit([](const auto& at) { return ResolveRate(at.rate); }, location);
}

} // namespace pwaudit::model

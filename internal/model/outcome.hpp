#pragma once

#include <cstdint>
#include <string_view>

namespace pwaudit::model {

// Terminal classification of one audit. Exactly one per invocation.
enum class Outcome : std::uint8_t {
  kError = 0,
  kDeviceNotFound = 1,
  kVolumeMismatch = 2,
  kAmbiguousSources = 3,
  kIdle = 4,
  kRateMismatch = 5,
  kConsistent = 6,
};

constexpr bool IsFailure(Outcome outcome) {
  switch (outcome) {
    case Outcome::kError:
    case Outcome::kVolumeMismatch:
    case Outcome::kAmbiguousSources:
    case Outcome::kRateMismatch:
      return true;
    case Outcome::kDeviceNotFound:
    case Outcome::kIdle:
    case Outcome::kConsistent:
    default:
      return false;
  }
}

constexpr std::string_view ToString(Outcome outcome) {
  switch (outcome) {
    case Outcome::kDeviceNotFound:
      return "device_not_found";
    case Outcome::kVolumeMismatch:
      return "volume_mismatch";
    case Outcome::kAmbiguousSources:
      return "ambiguous_sources";
    case Outcome::kIdle:
      return "idle";
    case Outcome::kRateMismatch:
      return "rate_mismatch";
    case Outcome::kConsistent:
      return "consistent";
    case Outcome::kError:
    default:
      return "error";
  }
}

} // namespace pwaudit::model

#include "internal/attributes/format_decoding.hpp"

#include "internal/graph/value_access.hpp"

namespace pwaudit::attributes {

using google::protobuf::Struct;
using google::protobuf::Value;

model::RateEncoding DecodeRateEncoding(const Value* rate) {
  if (rate == nullptr) {
    return std::monostate{};
  }

  if (rate->kind_case() == Value::kStructValue) {
    return model::RangeRate{graph::AsInteger(graph::FindField(rate->struct_value(), "default"))};
  }

  if (const auto direct = graph::AsInteger(rate)) {
    return model::DirectRate{*direct};
  }

  return std::monostate{};
}

model::FormatLocation DecodeFormatLocation(const Struct& format) {
  // The presence of "audio" decides the location even when it is not an object.
  if (const auto* audio = graph::FindField(format, "audio")) {
    if (audio->kind_case() != Value::kStructValue) {
      return model::NestedUnderAudio{};
    }
    return model::NestedUnderAudio{DecodeRateEncoding(graph::FindField(audio->struct_value(), "rate"))};
  }

  return model::TopLevel{DecodeRateEncoding(graph::FindField(format, "rate"))};
}

} // namespace pwaudit::attributes

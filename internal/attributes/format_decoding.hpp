#pragma once

#include <google/protobuf/struct.pb.h>

#include "internal/model/rate_encoding.hpp"

namespace pwaudit::attributes {

// Classifies a "rate" value. nullptr and unrecognised shapes decode to monostate.
model::RateEncoding DecodeRateEncoding(const google::protobuf::Value* rate);

// Decides whether a format object nests its rate under "audio" and decodes it from there.
model::FormatLocation DecodeFormatLocation(const google::protobuf::Struct& format);

} // namespace pwaudit::attributes

#pragma once

#include <libtextkit/serde/decoder.hpp>

#include <optional>
#include <string>

namespace textkit::serde {

// Decode hooks for ObjectDecoder::field. Errors from the underlying string
// decoding propagate unchanged.
//
//   struct StringData {
//       std::string string;
//
//       static auto decode(const Json::Value& json) -> StringData {
//           ObjectDecoder object(json);
//           return {object.field("string", trim_string)};
//       }
//   };

// "  Hello  " -> "Hello"
auto trim_string(const Json::Value& value) -> std::string;

// null, missing or all-whitespace -> std::nullopt, otherwise the trimmed string
auto trim_optional_string(const Json::Value& value) -> std::optional<std::string>;

} // namespace textkit::serde

#pragma once

#include <json/json.h>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace textkit::serde {

enum class DecodeErrorKind : uint8_t {
    TypeMismatch, // value is not of the requested type
    Malformed     // document is not valid JSON
};

class DecodeError : public std::runtime_error {
  public:
    DecodeError(DecodeErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    auto kind() const noexcept -> DecodeErrorKind {
        return kind_;
    }

  private:
    DecodeErrorKind kind_;
};

// Name of a JSON value type as used in error messages ("string", "null", ...)
auto type_name(const Json::Value& value) -> const char*;

// Parse a complete JSON document. Strict mode: the root must be an object or
// array, comments and trailing content are rejected.
auto parse_document(std::string_view json) -> Json::Value;

auto decode_string(const Json::Value& value) -> std::string;

// null decodes as std::nullopt
auto decode_optional_string(const Json::Value& value) -> std::optional<std::string>;

// Field-by-field access to a JSON object. A decode hook is any callable taking
// `const Json::Value&` and returning the field's value; it reports failure by
// throwing DecodeError. Missing members reach the hook as null.
// The object must outlive the decoder.
class ObjectDecoder {
  public:
    explicit ObjectDecoder(const Json::Value& object);
    ObjectDecoder(Json::Value&&) = delete;

    auto has_field(std::string_view name) const -> bool;

    // Raw member value, null when missing
    auto raw(std::string_view name) const -> const Json::Value&;

    template <typename Hook> auto field(std::string_view name, Hook&& hook) const {
        return std::forward<Hook>(hook)(raw(name));
    }

  private:
    const Json::Value& object_;
};

} // namespace textkit::serde

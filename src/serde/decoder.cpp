#include <libtextkit/logger.hpp>
#include <libtextkit/serde/decoder.hpp>

#include <memory>

namespace textkit::serde {

auto type_name(const Json::Value& value) -> const char* {
    switch (value.type()) {
        case Json::nullValue:
            return "null";
        case Json::intValue:
        case Json::uintValue:
        case Json::realValue:
            return "number";
        case Json::stringValue:
            return "string";
        case Json::booleanValue:
            return "boolean";
        case Json::arrayValue:
            return "array";
        case Json::objectValue:
            return "object";
    }
    return "unknown";
}

auto parse_document(std::string_view json) -> Json::Value {
    Json::CharReaderBuilder builder;
    Json::CharReaderBuilder::strictMode(&builder.settings_);
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    bool parsed = false;
    try {
        parsed = reader->parse(json.data(), json.data() + json.size(), &root, &errors);
    } catch (const Json::Exception& error) {
        // Nesting deeper than the reader's stackLimit throws instead of failing
        errors = error.what();
    }
    if (!parsed) {
        TEXTKIT_DEBUG("parse_document: {} bytes rejected", json.size());
        throw DecodeError(DecodeErrorKind::Malformed, "malformed JSON: " + errors);
    }
    return root;
}

auto decode_string(const Json::Value& value) -> std::string {
    if (!value.isString()) {
        throw DecodeError(DecodeErrorKind::TypeMismatch,
                          std::string("invalid type: expected string, found ") + type_name(value));
    }
    return value.asString();
}

auto decode_optional_string(const Json::Value& value) -> std::optional<std::string> {
    if (value.isNull()) {
        return std::nullopt;
    }
    if (!value.isString()) {
        throw DecodeError(DecodeErrorKind::TypeMismatch,
                          std::string("invalid type: expected string or null, found ") +
                              type_name(value));
    }
    return value.asString();
}

ObjectDecoder::ObjectDecoder(const Json::Value& object) : object_(object) {
    if (!object_.isObject()) {
        throw DecodeError(DecodeErrorKind::TypeMismatch,
                          std::string("invalid type: expected object, found ") +
                              type_name(object_));
    }
}

auto ObjectDecoder::has_field(std::string_view name) const -> bool {
    return object_.find(name.data(), name.data() + name.size()) != nullptr;
}

auto ObjectDecoder::raw(std::string_view name) const -> const Json::Value& {
    static const Json::Value null_value;
    const Json::Value* member = object_.find(name.data(), name.data() + name.size());
    return member != nullptr ? *member : null_value;
}

} // namespace textkit::serde

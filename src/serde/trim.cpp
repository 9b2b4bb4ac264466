#include <libtextkit/logger.hpp>
#include <libtextkit/serde/trim.hpp>
#include <libtextkit/utils/string_utils.hpp>

namespace textkit::serde {

auto trim_string(const Json::Value& value) -> std::string {
    return StringUtils::trim_whitespace(decode_string(value));
}

auto trim_optional_string(const Json::Value& value) -> std::optional<std::string> {
    auto decoded = decode_optional_string(value);
    if (!decoded) {
        return std::nullopt;
    }

    auto trimmed = StringUtils::trim_to_optional(*decoded);
    if (!trimmed) {
        TEXTKIT_TRACE("trim_optional_string: {} whitespace bytes dropped", decoded->size());
    }
    return trimmed;
}

} // namespace textkit::serde

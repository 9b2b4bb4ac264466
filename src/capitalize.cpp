#include <libtextkit/capitalize.hpp>
#include <libtextkit/logger.hpp>
#include <libtextkit/utils/string_utils.hpp>

#include <algorithm>

namespace textkit {

auto Capitalizer::capitalize(std::string_view input) -> std::string {
    if (input.empty()) {
        return {};
    }
    return uppercase_prefix(input, StringUtils::scalar_end(input, 0));
}

auto Capitalizer::capitalize_untrimmed(std::string_view input) -> std::string {
    if (input.empty()) {
        return {};
    }

    // Whitespace-only input falls back to the first scalar value
    size_t prefix_end = StringUtils::scalar_end(input, 0);
    size_t offset = 0;
    while (offset < input.size()) {
        auto scalar = StringUtils::decode_next(input, offset);
        if (!scalar || !StringUtils::is_whitespace(*scalar)) {
            prefix_end = offset;
            break;
        }
    }
    return uppercase_prefix(input, prefix_end);
}

auto Capitalizer::uppercase_prefix(std::string_view input, size_t prefix_end) -> std::string {
    prefix_end = std::min(prefix_end, input.size());

    std::string result = StringUtils::to_upper(input.substr(0, prefix_end));
    TEXTKIT_TRACE("capitalize: {} prefix bytes -> {} bytes", prefix_end, result.size());
    result.append(input.substr(prefix_end));
    return result;
}

} // namespace textkit

#include <libtextkit/utils/string_utils.hpp>

#include <cstdint>

#include <unicode/locid.h>
#include <unicode/stringpiece.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>

namespace textkit {

auto StringUtils::decode_next(std::string_view text, size_t& offset) -> std::optional<char32_t> {
    const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());
    const size_t length = text.size();
    UChar32 scalar = 0;
    U8_NEXT(bytes, offset, length, scalar);
    if (scalar < 0) {
        return std::nullopt;
    }
    return static_cast<char32_t>(scalar);
}

auto StringUtils::scalar_end(std::string_view text, size_t offset) -> size_t {
    if (offset >= text.size()) {
        return text.size();
    }
    (void)decode_next(text, offset);
    return offset;
}

auto StringUtils::is_whitespace(char32_t scalar) -> bool {
    return u_isUWhiteSpace(static_cast<UChar32>(scalar)) != 0;
}

auto StringUtils::is_well_formed(std::string_view text) -> bool {
    size_t offset = 0;
    while (offset < text.size()) {
        if (!decode_next(text, offset)) {
            return false;
        }
    }
    return true;
}

auto StringUtils::to_upper(std::string_view text) -> std::string {
    if (text.empty() || !is_well_formed(text)) {
        return std::string(text);
    }

    auto unicode = icu::UnicodeString::fromUTF8(
        icu::StringPiece(text.data(), static_cast<int32_t>(text.size())));
    unicode.toUpper(icu::Locale::getRoot());

    std::string result;
    unicode.toUTF8String(result);
    return result;
}

auto StringUtils::trim_whitespace(std::string_view text) -> std::string {
    size_t start = text.size();
    size_t end = 0;
    size_t offset = 0;
    while (offset < text.size()) {
        const size_t scalar_start = offset;
        auto scalar = decode_next(text, offset);
        if (scalar && is_whitespace(*scalar)) {
            continue;
        }
        if (start == text.size()) {
            start = scalar_start;
        }
        end = offset;
    }
    if (start >= end) {
        return {};
    }
    return std::string(text.substr(start, end - start));
}

auto StringUtils::trim_to_optional(std::string_view text) -> std::optional<std::string> {
    std::string trimmed = trim_whitespace(text);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    return trimmed;
}

} // namespace textkit

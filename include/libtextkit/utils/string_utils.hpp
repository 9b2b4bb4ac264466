#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace textkit {

// UTF-8 helpers shared by the capitalizer and the field trimmer.
// "Whitespace" is the Unicode White_Space property throughout.
class StringUtils {
  public:
    // Decode the scalar value starting at byte `offset` and advance `offset` past it.
    // Ill-formed sequences advance past the maximal ill-formed subpart and return
    // std::nullopt. `offset` must be < text.size().
    static auto decode_next(std::string_view text, size_t& offset) -> std::optional<char32_t>;

    // Byte offset one past the scalar value starting at `offset`
    static auto scalar_end(std::string_view text, size_t offset) -> size_t;

    static auto is_whitespace(char32_t scalar) -> bool;

    static auto is_well_formed(std::string_view text) -> bool;

    // Full (possibly expanding) uppercase mapping, locale independent.
    // Ill-formed input is returned unchanged.
    static auto to_upper(std::string_view text) -> std::string;

    // Strip leading and trailing whitespace
    static auto trim_whitespace(std::string_view text) -> std::string;

    // Trim; an empty result becomes std::nullopt
    static auto trim_to_optional(std::string_view text) -> std::optional<std::string>;
};

} // namespace textkit

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace textkit {

// First-letter uppercasing. Both operations take any string-like value
// (std::string, std::string_view, literals) and return a new string; the
// input is never modified.
class Capitalizer {
  public:
    // Uppercase the first scalar value. Leading whitespace is not skipped, so
    // " hello" is returned unchanged.
    static auto capitalize(std::string_view input) -> std::string;

    // Uppercase the leading whitespace run together with the first
    // non-whitespace scalar value: " hello" -> " Hello".
    static auto capitalize_untrimmed(std::string_view input) -> std::string;

  private:
    static auto uppercase_prefix(std::string_view input, size_t prefix_end) -> std::string;
};

inline auto capitalize(std::string_view input) -> std::string {
    return Capitalizer::capitalize(input);
}

inline auto capitalize_untrimmed(std::string_view input) -> std::string {
    return Capitalizer::capitalize_untrimmed(input);
}

} // namespace textkit

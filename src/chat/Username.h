#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace textrelay::chat {

// Byte length of the UTF-8 encoded White_Space code point that `s` starts
// with, or 0. Covers ASCII \t \n \v \f \r and space, U+0085, U+00A0,
// U+1680, U+2000-U+200A, U+2028, U+2029, U+202F, U+205F and U+3000.
std::size_t leading_space(std::string_view s) noexcept;

// Same, for the code point that `s` ends with.
std::size_t trailing_space(std::string_view s) noexcept;

std::string trim_copy(std::string s);

// True for empty and whitespace-only names.
bool is_blank(std::string_view name) noexcept;

} // namespace textrelay::chat

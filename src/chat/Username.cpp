#include "chat/Username.h"

namespace textrelay::chat {

namespace {

bool is_ascii_space(unsigned char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// Multi-byte whitespace: C2 xx, E1 9A 80, E2 80 xx, E2 81 9F, E3 80 80.
bool is_wide_space(std::string_view s) noexcept {
    auto at = [&s](std::size_t i) { return static_cast<unsigned char>(s[i]); };

    if (s.size() == 2) {
        return at(0) == 0xC2 && (at(1) == 0x85 || at(1) == 0xA0);
    }
    if (s.size() != 3) return false;

    switch (at(0)) {
        case 0xE1:
            return at(1) == 0x9A && at(2) == 0x80;
        case 0xE2:
            if (at(1) == 0x80) {
                return at(2) <= 0x8A || at(2) == 0xA8 || at(2) == 0xA9 || at(2) == 0xAF;
            }
            return at(1) == 0x81 && at(2) == 0x9F;
        case 0xE3:
            return at(1) == 0x80 && at(2) == 0x80;
        default:
            return false;
    }
}

} // namespace

std::size_t leading_space(std::string_view s) noexcept {
    if (s.empty()) return 0;
    if (is_ascii_space(static_cast<unsigned char>(s[0]))) return 1;

    for (std::size_t len = 2; len <= 3 && len <= s.size(); ++len) {
        if (is_wide_space(s.substr(0, len))) return len;
    }
    return 0;
}

std::size_t trailing_space(std::string_view s) noexcept {
    if (s.empty()) return 0;
    if (is_ascii_space(static_cast<unsigned char>(s.back()))) return 1;

    // UTF-8 lead bytes never look like continuation bytes, so a matching
    // suffix is always a whole code point.
    for (std::size_t len = 2; len <= 3 && len <= s.size(); ++len) {
        if (is_wide_space(s.substr(s.size() - len))) return len;
    }
    return 0;
}

std::string trim_copy(std::string s) {
    std::string_view view(s);

    while (std::size_t n = leading_space(view)) view.remove_prefix(n);
    while (std::size_t n = trailing_space(view)) view.remove_suffix(n);

    if (view.size() == s.size()) return s;
    return std::string(view);
}

bool is_blank(std::string_view name) noexcept {
    while (std::size_t n = leading_space(name)) name.remove_prefix(n);
    return name.empty();
}

} // namespace textrelay::chat

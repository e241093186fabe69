#pragma once

#include "common.h"

#include <array>

namespace scifmt {

namespace detail {
enum char_bits {
    is_space = 1 << 1,
    is_lower = 1 << 2,
    is_upper = 1 << 3,
    is_alpha = 1 << 4,
    is_alnum = 1 << 5,
};
struct char_tbl_t {
    std::array<std::uint8_t, 256> digs{};
    std::array<std::uint8_t, 256> flags{};
    constexpr char_tbl_t() {
        for (unsigned ch = 0; ch < 256; ++ch) {
            if (ch >= '0' && ch <= '9') {
                digs[ch] = ch - '0', flags[ch] = is_alnum;
            } else if (ch >= 'a' && ch <= 'z') {
                digs[ch] = ch - 'a' + 10, flags[ch] = is_lower | is_alpha | is_alnum;
            } else if (ch >= 'A' && ch <= 'Z') {
                digs[ch] = ch - 'A' + 10, flags[ch] = is_upper | is_alpha | is_alnum;
            } else {
                digs[ch] = 255, flags[ch] = ch == ' ' || (ch >= '\t' && ch <= '\r') ? is_space : 0;
            }
        }
    }
};
static constexpr char_tbl_t g_char_tbl{};
}  // namespace detail

constexpr bool is_digit(char ch) { return detail::g_char_tbl.digs[static_cast<std::uint8_t>(ch)] < 10; }
constexpr bool is_space(char ch) {
    return (detail::g_char_tbl.flags[static_cast<std::uint8_t>(ch)] & detail::char_bits::is_space) != 0;
}
constexpr bool is_lower(char ch) {
    return (detail::g_char_tbl.flags[static_cast<std::uint8_t>(ch)] & detail::char_bits::is_lower) != 0;
}
constexpr bool is_upper(char ch) {
    return (detail::g_char_tbl.flags[static_cast<std::uint8_t>(ch)] & detail::char_bits::is_upper) != 0;
}
constexpr char to_lower(char ch) { return is_upper(ch) ? ch + ('a' - 'A') : ch; }
constexpr char to_upper(char ch) { return is_lower(ch) ? ch - ('a' - 'A') : ch; }

// decimal digit value or >= 10 for any other character
constexpr unsigned dig_v(char ch) { return detail::g_char_tbl.digs[static_cast<std::uint8_t>(ch)]; }

}  // namespace scifmt

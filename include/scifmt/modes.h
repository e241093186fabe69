#pragma once

#include "common.h"

namespace scifmt {

enum class exp_mode : std::uint8_t {
    fixed_point = 0,
    percent,
    scientific,
    engineering,
    engineering_shifted,
    binary,
    binary_iec,
};

enum class round_mode : std::uint8_t { sig_fig = 0, dec_place };

enum class sign_mode : std::uint8_t { negative = 0, always, space };

enum class upper_separator : std::uint8_t { none = 0, comma, point, space, underscore };
enum class decimal_separator : std::uint8_t { point = 0, comma };
enum class lower_separator : std::uint8_t { none = 0, space, underscore };

enum class left_pad_char : std::uint8_t { space = 0, zero };

enum class exp_format : std::uint8_t { standard = 0, prefix, parts_per };

constexpr bool is_binary(exp_mode mode) { return mode == exp_mode::binary || mode == exp_mode::binary_iec; }
constexpr int exp_base(exp_mode mode) { return is_binary(mode) ? 2 : 10; }

// Separator text; empty for `none`
constexpr const char* separator_str(upper_separator sep) {
    switch (sep) {
        case upper_separator::none: return "";
        case upper_separator::comma: return ",";
        case upper_separator::point: return ".";
        case upper_separator::space: return " ";
        case upper_separator::underscore: return "_";
    }
    return "";
}
constexpr const char* separator_str(decimal_separator sep) { return sep == decimal_separator::comma ? "," : "."; }
constexpr const char* separator_str(lower_separator sep) {
    switch (sep) {
        case lower_separator::none: return "";
        case lower_separator::space: return " ";
        case lower_separator::underscore: return "_";
    }
    return "";
}

constexpr char pad_char_v(left_pad_char ch) { return ch == left_pad_char::zero ? '0' : ' '; }

}  // namespace scifmt

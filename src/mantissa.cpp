#include "scifmt/mantissa.h"

#include "scifmt/chars.h"

#include <algorithm>

namespace scifmt {

std::string get_sign_str(const decimal& x, sign_mode mode) {
    if (x.is_infinite() ? x.signbit() : x.sign() < 0) { return "-"; }
    if (x.is_infinite() || x.sign() > 0) {
        switch (mode) {
            case sign_mode::negative: return {};
            case sign_mode::always: return "+";
            case sign_mode::space: return " ";
        }
    }
    return mode == sign_mode::negative ? std::string{} : std::string(" ");
}

std::string get_pad_str(char pad_char, int top, int target_top) {
    if (target_top <= top) { return {}; }
    return std::string(static_cast<std::size_t>(target_top - std::max(top, 0)), pad_char);
}

std::string format_num_by_top_bottom_dig(const decimal& x, int target_top, int target_bottom, sign_mode mode,
                                         char pad_char) {
    const int print_prec = std::max(0, -target_bottom);
    return get_sign_str(x, mode) + get_pad_str(pad_char, top_digit(x), target_top) + x.to_fixed(print_prec);
}

std::string add_separators(std::string_view s, upper_separator upper, decimal_separator dec, lower_separator lower) {
    const std::string_view upper_sep = separator_str(upper), lower_sep = separator_str(lower);
    const std::size_t point = std::min(s.find('.'), s.size());

    std::string result;
    result.reserve(s.size() + s.size() / 3 * std::max(upper_sep.size(), lower_sep.size()));
    for (std::size_t i = 0; i < point; ++i) {
        result += s[i];
        // the digit run always extends up to the point
        if (is_digit(s[i]) && i + 1 < point && is_digit(s[i + 1]) && (point - i - 1) % 3 == 0) {
            result += upper_sep;
        }
    }
    if (point == s.size()) { return result; }

    result += separator_str(dec);
    for (std::size_t i = point + 1; i < s.size(); ++i) {
        result += s[i];
        if (is_digit(s[i]) && i + 1 < s.size() && is_digit(s[i + 1]) && (i - point) % 3 == 0) { result += lower_sep; }
    }
    return result;
}

}  // namespace scifmt

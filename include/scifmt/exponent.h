#pragma once

#include "decimal.h"
#include "options.h"

#include <string>

namespace scifmt {

// Display exponent of `x` for `mode`; zero and non-finite values get 0 or the fixed value
SCIFMT_EXPORT int resolve_exponent(const decimal& x, exp_mode mode, const auto_or_int& exp_val);

struct mantissa_exp_base {
    decimal mantissa;
    int exp = 0;
    int base = 10;
};

// `x` split as mantissa * base^exp; the mantissa is normalized
SCIFMT_EXPORT mantissa_exp_base get_mantissa_exp_base(const decimal& x, exp_mode mode, const auto_or_int& exp_val);

// Mode allowing an arbitrary fixed exponent with the same base
constexpr exp_mode free_exp_mode(exp_mode mode) {
    switch (mode) {
        case exp_mode::engineering:
        case exp_mode::engineering_shifted: return exp_mode::scientific;
        case exp_mode::binary_iec: return exp_mode::binary;
        default: return mode;
    }
}

// --------------------------

enum class rendering : std::uint8_t { plain = 0, superscript, ascii, html, latex };

// Description of the text following the mantissa
struct exp_suffix {
    enum class kind : std::uint8_t { none = 0, percent, prefix, standard };
    kind type = kind::none;
    int base = 10;
    int exp = 0;
    bool capitalize = false;
    std::string prefix;  // token for `kind::prefix`, may be empty
};

SCIFMT_EXPORT exp_suffix make_exp_suffix(exp_mode mode, int exp, const resolved_options& opts);

SCIFMT_EXPORT std::string render_exp_suffix(const exp_suffix& suffix, rendering r);

// `e+03`, `E-12` or `b+10`
SCIFMT_EXPORT std::string standard_exp_str(int base, int exp, bool capitalize);

// `×10³`, `×2⁻⁵`
SCIFMT_EXPORT std::string superscript_exp_str(int base, int exp);

}  // namespace scifmt

#include "scifmt/exponent.h"

#include "scifmt/exception.h"

#include <array>

namespace scifmt {

inline int floor_div(int a, int b) {
    const int q = a / b;
    return (a % b != 0 && (a < 0) != (b < 0)) ? q - 1 : q;
}

int resolve_exponent(const decimal& x, exp_mode mode, const auto_or_int& exp_val) {
    validate_exp_val(mode, exp_val);
    if (exp_val) { return *exp_val; }
    if (!x.is_finite() || x.is_zero()) { return 0; }
    switch (mode) {
        case exp_mode::fixed_point:
        case exp_mode::percent: return 0;
        case exp_mode::scientific: return top_digit(x);
        case exp_mode::engineering: return floor_div(top_digit(x), 3) * 3;
        case exp_mode::engineering_shifted: return floor_div(top_digit(x) + 1, 3) * 3;
        case exp_mode::binary: return top_digit_binary(x);
        case exp_mode::binary_iec: return floor_div(top_digit_binary(x), 10) * 10;
    }
    SCIFMT_UNREACHABLE_CODE;
}

mantissa_exp_base get_mantissa_exp_base(const decimal& x, exp_mode mode, const auto_or_int& exp_val) {
    mantissa_exp_base result;
    result.base = exp_base(mode);
    result.exp = resolve_exponent(x, mode, exp_val);
    if (!x.is_finite() || x.is_zero()) {
        result.mantissa = x.normalize();
    } else if (result.base == 2) {
        result.mantissa = x.mul_pow2(-result.exp).normalize();
    } else {
        result.mantissa = x.scaleb(-result.exp).normalize();
    }
    return result;
}

// --------------------------

static const prefix_table& prefix_table_for(exp_format format, int base) {
    switch (format) {
        case exp_format::prefix: return base == 2 ? iec_prefixes() : si_prefixes();
        case exp_format::parts_per: return parts_per_forms();
        case exp_format::standard: break;
    }
    throw format_error("standard exponent format has no prefix table");
}

exp_suffix make_exp_suffix(exp_mode mode, int exp, const resolved_options& opts) {
    exp_suffix suffix;
    suffix.base = exp_base(mode), suffix.exp = exp, suffix.capitalize = opts.capitalize;
    if (mode == exp_mode::fixed_point) { return suffix; }
    if (mode == exp_mode::percent) {
        suffix.type = exp_suffix::kind::percent;
        return suffix;
    }

    if (opts.exp_format != exp_format::standard) {
        const prefix_table* extra = &opts.extra_parts_per_forms;
        if (opts.exp_format == exp_format::prefix) {
            extra = suffix.base == 2 ? &opts.extra_iec_prefixes : &opts.extra_si_prefixes;
        }
        const prefix_table tbl = merge_prefix_tables(prefix_table_for(opts.exp_format, suffix.base), *extra);
        const std::optional<std::string> token = find_prefix(tbl, exp);
        if (token) {
            const auto last = token->find_last_not_of(' ');
            suffix.type = last == std::string::npos ? exp_suffix::kind::none : exp_suffix::kind::prefix;
            if (last != std::string::npos) { suffix.prefix = token->substr(0, last + 1); }
            return suffix;
        }
    }

    suffix.type = exp_suffix::kind::standard;
    return suffix;
}

std::string standard_exp_str(int base, int exp, bool capitalize) {
    std::string s(1, base == 2 ? (capitalize ? 'B' : 'b') : (capitalize ? 'E' : 'e'));
    s += exp < 0 ? '-' : '+';
    const unsigned abs_exp = exp < 0 ? 0u - static_cast<unsigned>(exp) : static_cast<unsigned>(exp);
    if (abs_exp < 10) { s += '0'; }
    return s + std::to_string(abs_exp);
}

std::string superscript_exp_str(int base, int exp) {
    static const std::array<const char*, 10> sup_digits{"⁰", "¹", "²", "³", "⁴", "⁵", "⁶", "⁷", "⁸", "⁹"};
    std::string s = "×" + std::to_string(base);
    if (exp < 0) { s += "⁻"; }
    const unsigned abs_exp = exp < 0 ? 0u - static_cast<unsigned>(exp) : static_cast<unsigned>(exp);
    for (char ch : std::to_string(abs_exp)) { s += sup_digits[ch - '0']; }
    return s;
}

static std::string ascii_prefix(const std::string& token) {
    std::string s;
    s.reserve(token.size());
    for (std::size_t pos = 0; pos < token.size();) {
        if (token.compare(pos, 2, "μ") == 0) {
            s += 'u', pos += 2;
        } else {
            s += token[pos++];
        }
    }
    return s;
}

std::string render_exp_suffix(const exp_suffix& suffix, rendering r) {
    switch (suffix.type) {
        case exp_suffix::kind::none: return {};
        case exp_suffix::kind::percent: return r == rendering::latex ? "\\%" : "%";
        case exp_suffix::kind::prefix: {
            switch (r) {
                case rendering::ascii: return ' ' + ascii_prefix(suffix.prefix);
                case rendering::latex: return "\\text{ " + suffix.prefix + '}';
                default: return ' ' + suffix.prefix;
            }
        } break;
        case exp_suffix::kind::standard: {
            switch (r) {
                case rendering::plain:
                case rendering::ascii: return standard_exp_str(suffix.base, suffix.exp, suffix.capitalize);
                case rendering::superscript: return superscript_exp_str(suffix.base, suffix.exp);
                case rendering::html: {
                    return "×" + std::to_string(suffix.base) + "<sup>" + std::to_string(suffix.exp) + "</sup>";
                }
                case rendering::latex: {
                    return "\\times " + std::to_string(suffix.base) + "^{" + (suffix.exp < 0 ? "-" : "+") +
                           std::to_string(suffix.exp < 0 ? -suffix.exp : suffix.exp) + '}';
                }
            }
        } break;
    }
    SCIFMT_UNREACHABLE_CODE;
}

}  // namespace scifmt

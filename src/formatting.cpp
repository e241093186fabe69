#include "scifmt/formatting.h"

#include "scifmt/exception.h"
#include "scifmt/mantissa.h"
#include "scifmt/rounding.h"
#include "scifmt/stringalg.h"

#include <algorithm>

namespace scifmt {

static std::string non_finite_token(const decimal& x, bool capitalize) {
    std::string token = x.is_nan() ? "nan" : (x.signbit() ? "-inf" : "inf");
    return capitalize ? to_upper(token) : token;
}

// Non-finite values carry an exponent only with `nan_inf_exp`; percent keeps its sign
static exp_mode non_finite_exp_mode(const resolved_options& opts) {
    if (opts.nan_inf_exp || opts.exp_mode == exp_mode::percent) { return opts.exp_mode; }
    return exp_mode::fixed_point;
}

static decimal scale_by_base(const decimal& x, int base, int exp) {
    return base == 2 ? x.mul_pow2(exp) : x.scaleb(exp);
}

static formatted_number format_non_finite(const decimal& value, const resolved_options& opts) {
    const exp_mode mode = non_finite_exp_mode(opts);
    const int exp = mode == opts.exp_mode ? opts.exp_val.value_or(0) : 0;
    return formatted_number(non_finite_token(value, opts.capitalize), make_exp_suffix(mode, exp, opts), true, opts,
                            value);
}

formatted_number format(const decimal& value, const resolved_options& opts) {
    if (!value.is_finite()) { return format_non_finite(value, opts); }

    const decimal num = opts.exp_mode == exp_mode::percent ? value.scaleb(2) : value;

    mantissa_exp_base split = get_mantissa_exp_base(num, opts.exp_mode, opts.exp_val);
    int round_digit = get_round_digit(split.mantissa, opts.round_mode, opts.ndigits, false);
    decimal mantissa_rounded = round_to_digit(split.mantissa, round_digit);

    // rounding may carry into a new leading digit, which can change the exponent
    const decimal rounded_num = scale_by_base(mantissa_rounded, split.base, split.exp);
    split = get_mantissa_exp_base(rounded_num, opts.exp_mode, opts.exp_val);
    round_digit = get_round_digit(split.mantissa, opts.round_mode, opts.ndigits, false);
    mantissa_rounded = round_to_digit(split.mantissa, round_digit);

    int exp = split.exp;
    if (mantissa_rounded.is_zero()) { exp = 0; }

    const std::string mantissa_str = format_num_by_top_bottom_dig(
        mantissa_rounded.normalize(), opts.left_pad_dec_place, round_digit, opts.sign_mode,
        pad_char_v(opts.left_pad_char));
    return formatted_number(
        add_separators(mantissa_str, opts.upper_separator, opts.decimal_separator, opts.lower_separator),
        make_exp_suffix(opts.exp_mode, exp, opts), false, opts, value);
}

// --------------------------

struct rounded_val_unc {
    decimal val;
    decimal unc;
    int round_digit = 0;
};

// A finite non-zero uncertainty sets the rounding place for both; otherwise the value does
static rounded_val_unc round_val_unc(const decimal& val, const decimal& unc, const auto_or_int& ndigits,
                                     bool pdg_sig_figs) {
    rounded_val_unc result;
    if (unc.is_finite() && !unc.is_zero()) {
        result.round_digit = get_round_digit(unc, round_mode::sig_fig, ndigits, pdg_sig_figs);
        result.unc = round_to_digit(unc, result.round_digit);
    } else {
        result.round_digit = get_round_digit(val, round_mode::sig_fig, ndigits, false);
        result.unc = unc;
    }
    result.val = val.is_finite() ? round_to_digit(val, result.round_digit) : val;
    return result;
}

static std::string format_mantissa(const decimal& mantissa, int target_top, int prec, sign_mode sign,
                                   const resolved_options& opts) {
    if (!mantissa.is_finite()) { return non_finite_token(mantissa, opts.capitalize); }
    const std::string s = format_num_by_top_bottom_dig(round_to_digit(mantissa, -prec).normalize(), target_top, -prec,
                                                       sign, pad_char_v(opts.left_pad_char));
    return add_separators(s, opts.upper_separator, opts.decimal_separator, opts.lower_separator);
}

formatted_number format(const decimal& value, const decimal& uncertainty, const resolved_options& opts) {
    std::vector<std::string> warnings;
    if (opts.round_mode == round_mode::dec_place) {
        if (opts.ndigits && *opts.ndigits < 1) {
            throw config_error(
                "value/uncertainty formatting rounds the uncertainty to significant figures, which requires at "
                "least 1 digit, got " +
                std::to_string(*opts.ndigits));
        }
        warnings.emplace_back(
            "decimal place rounding is not available for value/uncertainty formatting, the uncertainty is rounded "
            "to significant figures instead");
    }

    decimal val = value, unc = uncertainty.abs();
    if (opts.exp_mode == exp_mode::percent) { val = val.scaleb(2), unc = unc.scaleb(2); }

    rounded_val_unc rounded = round_val_unc(val, unc, opts.ndigits, opts.pdg_sig_figs);
    // the first rounding may have moved the leading digit of the rounding driver
    rounded = round_val_unc(rounded.val, rounded.unc, opts.ndigits, opts.pdg_sig_figs);

    const bool any_finite = rounded.val.is_finite() || rounded.unc.is_finite();
    int exp = 0, prec = 0;
    decimal val_mantissa = rounded.val, unc_mantissa = rounded.unc;
    if (any_finite) {
        exp = resolve_exponent(rounded.val.is_finite() ? rounded.val : rounded.unc, opts.exp_mode, opts.exp_val);
        const exp_mode free_mode = free_exp_mode(opts.exp_mode);
        val_mantissa = get_mantissa_exp_base(rounded.val, free_mode, exp).mantissa;
        unc_mantissa = get_mantissa_exp_base(rounded.unc, free_mode, exp).mantissa;
        prec = exp - rounded.round_digit;
    }

    int target_top = opts.left_pad_dec_place;
    if (opts.left_pad_matching) {
        target_top = std::max({target_top, top_digit(val_mantissa), top_digit(unc_mantissa)});
    }

    const std::string val_str = format_mantissa(val_mantissa, target_top, prec, opts.sign_mode, opts);
    std::string unc_str = format_mantissa(unc_mantissa, target_top, prec, sign_mode::negative, opts);

    std::string body;
    if (opts.paren_uncertainty) {
        if (rounded.val.is_finite() && rounded.unc.is_zero()) {
            unc_str = "0";
        } else if (opts.paren_uncertainty_trim && rounded.val.is_finite() && rounded.unc.is_finite() &&
                   rounded.unc.compare_abs(rounded.val) < 0) {
            unc_str = remove_chars(unc_str, ",. _");
            unc_str.erase(0, std::min(unc_str.find_first_not_of('0'), unc_str.size()));
        }
        body = val_str + '(' + unc_str + ')';
    } else {
        body = val_str + (opts.pm_whitespace ? " ± " : "±") + unc_str;
    }

    const exp_mode suffix_mode = any_finite ? opts.exp_mode : non_finite_exp_mode(opts);
    exp_suffix suffix = make_exp_suffix(suffix_mode, exp, opts);
    // `val(unc)` takes a prefix directly, but an exponent or percent still needs the parentheses
    const bool wrap = !opts.paren_uncertainty || suffix.type == exp_suffix::kind::standard ||
                      suffix.type == exp_suffix::kind::percent;
    formatted_number result(std::move(body), std::move(suffix), wrap, opts, value, uncertainty);
    for (auto& w : warnings) { result.add_warning(std::move(w)); }
    return result;
}

}  // namespace scifmt

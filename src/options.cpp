#include "scifmt/options.h"

#include "scifmt/decimal.h"
#include "scifmt/exception.h"

#include <limits>
#include <string>

namespace scifmt {

template<typename Ty>
void merge_field(std::optional<Ty>& field, const std::optional<Ty>& other) {
    if (other) { field = other; }
}

user_options& user_options::merge(const user_options& other) {
    merge_field(exp_mode, other.exp_mode);
    merge_field(exp_val, other.exp_val);
    merge_field(round_mode, other.round_mode);
    merge_field(ndigits, other.ndigits);
    merge_field(upper_separator, other.upper_separator);
    merge_field(decimal_separator, other.decimal_separator);
    merge_field(lower_separator, other.lower_separator);
    merge_field(sign_mode, other.sign_mode);
    merge_field(left_pad_char, other.left_pad_char);
    merge_field(left_pad_dec_place, other.left_pad_dec_place);
    merge_field(exp_format, other.exp_format);
    merge_field(extra_si_prefixes, other.extra_si_prefixes);
    merge_field(extra_iec_prefixes, other.extra_iec_prefixes);
    merge_field(extra_parts_per_forms, other.extra_parts_per_forms);
    merge_field(capitalize, other.capitalize);
    merge_field(superscript, other.superscript);
    merge_field(latex, other.latex);
    merge_field(nan_inf_exp, other.nan_inf_exp);
    merge_field(paren_uncertainty, other.paren_uncertainty);
    merge_field(pdg_sig_figs, other.pdg_sig_figs);
    merge_field(left_pad_matching, other.left_pad_matching);
    merge_field(paren_uncertainty_trim, other.paren_uncertainty_trim);
    merge_field(pm_whitespace, other.pm_whitespace);
    merge_field(add_c_prefix, other.add_c_prefix);
    merge_field(add_small_si_prefixes, other.add_small_si_prefixes);
    merge_field(add_ppth_form, other.add_ppth_form);
    return *this;
}

const user_options& builtin_defaults() {
    static const user_options defaults = []() {
        const resolved_options r;
        user_options opts;
        opts.exp_mode = r.exp_mode;
        opts.exp_val.emplace(r.exp_val);
        opts.round_mode = r.round_mode;
        opts.ndigits.emplace(r.ndigits);
        opts.upper_separator = r.upper_separator;
        opts.decimal_separator = r.decimal_separator;
        opts.lower_separator = r.lower_separator;
        opts.sign_mode = r.sign_mode;
        opts.left_pad_char = r.left_pad_char;
        opts.left_pad_dec_place = r.left_pad_dec_place;
        opts.exp_format = r.exp_format;
        opts.extra_si_prefixes = r.extra_si_prefixes;
        opts.extra_iec_prefixes = r.extra_iec_prefixes;
        opts.extra_parts_per_forms = r.extra_parts_per_forms;
        opts.capitalize = r.capitalize;
        opts.superscript = r.superscript;
        opts.latex = r.latex;
        opts.nan_inf_exp = r.nan_inf_exp;
        opts.paren_uncertainty = r.paren_uncertainty;
        opts.pdg_sig_figs = r.pdg_sig_figs;
        opts.left_pad_matching = r.left_pad_matching;
        opts.paren_uncertainty_trim = r.paren_uncertainty_trim;
        opts.pm_whitespace = r.pm_whitespace;
        opts.add_c_prefix = false;
        opts.add_small_si_prefixes = false;
        opts.add_ppth_form = false;
        return opts;
    }();
    return defaults;
}

// --------------------------

template<typename Ty>
Ty populate_field(const std::optional<Ty>& user, const std::optional<Ty>& defaults, Ty fallback) {
    if (user) { return *user; }
    if (defaults) { return *defaults; }
    return fallback;
}

// An `add_*` flag set by the caller starts from an empty table rather than the layer below
static prefix_table populate_table(const std::optional<prefix_table>& user, const std::optional<prefix_table>& defaults,
                                   bool added_by_user) {
    if (user) { return *user; }
    if (added_by_user || !defaults) { return {}; }
    return *defaults;
}

static void add_entries(prefix_table& tbl, const prefix_table& entries) {
    for (const auto& item : entries) { tbl.emplace(item.first, item.second); }
}

resolved_options populate_options(const user_options& user, const user_options& defaults) {
    resolved_options r;
    r.exp_mode = populate_field(user.exp_mode, defaults.exp_mode, r.exp_mode);
    r.exp_val = populate_field(user.exp_val, defaults.exp_val, r.exp_val);
    r.round_mode = populate_field(user.round_mode, defaults.round_mode, r.round_mode);
    r.ndigits = populate_field(user.ndigits, defaults.ndigits, r.ndigits);
    r.upper_separator = populate_field(user.upper_separator, defaults.upper_separator, r.upper_separator);
    r.decimal_separator = populate_field(user.decimal_separator, defaults.decimal_separator, r.decimal_separator);
    r.lower_separator = populate_field(user.lower_separator, defaults.lower_separator, r.lower_separator);
    r.sign_mode = populate_field(user.sign_mode, defaults.sign_mode, r.sign_mode);
    r.left_pad_char = populate_field(user.left_pad_char, defaults.left_pad_char, r.left_pad_char);
    r.left_pad_dec_place = populate_field(user.left_pad_dec_place, defaults.left_pad_dec_place, r.left_pad_dec_place);
    r.exp_format = populate_field(user.exp_format, defaults.exp_format, r.exp_format);
    r.capitalize = populate_field(user.capitalize, defaults.capitalize, r.capitalize);
    r.superscript = populate_field(user.superscript, defaults.superscript, r.superscript);
    r.latex = populate_field(user.latex, defaults.latex, r.latex);
    r.nan_inf_exp = populate_field(user.nan_inf_exp, defaults.nan_inf_exp, r.nan_inf_exp);
    r.paren_uncertainty = populate_field(user.paren_uncertainty, defaults.paren_uncertainty, r.paren_uncertainty);
    r.pdg_sig_figs = populate_field(user.pdg_sig_figs, defaults.pdg_sig_figs, r.pdg_sig_figs);
    r.left_pad_matching = populate_field(user.left_pad_matching, defaults.left_pad_matching, r.left_pad_matching);
    r.paren_uncertainty_trim = populate_field(user.paren_uncertainty_trim, defaults.paren_uncertainty_trim,
                                              r.paren_uncertainty_trim);
    r.pm_whitespace = populate_field(user.pm_whitespace, defaults.pm_whitespace, r.pm_whitespace);

    const bool user_adds_si = user.add_c_prefix.value_or(false) || user.add_small_si_prefixes.value_or(false);
    const bool user_adds_pp = user.add_ppth_form.value_or(false);
    r.extra_si_prefixes = populate_table(user.extra_si_prefixes, defaults.extra_si_prefixes, user_adds_si);
    r.extra_iec_prefixes = populate_table(user.extra_iec_prefixes, defaults.extra_iec_prefixes, false);
    r.extra_parts_per_forms = populate_table(user.extra_parts_per_forms, defaults.extra_parts_per_forms,
                                             user_adds_pp);

    if (populate_field(user.add_c_prefix, defaults.add_c_prefix, false)) { add_entries(r.extra_si_prefixes, c_prefix()); }
    if (populate_field(user.add_small_si_prefixes, defaults.add_small_si_prefixes, false)) {
        add_entries(r.extra_si_prefixes, small_si_prefixes());
    }
    if (populate_field(user.add_ppth_form, defaults.add_ppth_form, false)) {
        add_entries(r.extra_parts_per_forms, ppth_form());
    }

    validate_options(r);
    return r;
}

// --------------------------

static bool is_multiple_of(int val, int n) { return val % n == 0; }

static void check_digit_place(const char* what, int val) {
    if (val < -decimal::max_exponent || val > decimal::max_exponent) {
        throw config_error(std::string(what) + " out of range, got " + std::to_string(val));
    }
}

void validate_exp_val(exp_mode mode, const auto_or_int& exp_val) {
    if (!exp_val) { return; }
    check_digit_place("exponent value", *exp_val);
    switch (mode) {
        case exp_mode::fixed_point:
        case exp_mode::percent: {
            if (*exp_val != 0) {
                throw config_error("exponent value must be 0 for fixed point and percent modes, got " +
                                   std::to_string(*exp_val));
            }
        } break;
        case exp_mode::engineering:
        case exp_mode::engineering_shifted: {
            if (!is_multiple_of(*exp_val, 3)) {
                throw config_error("exponent value must be a multiple of 3 for engineering modes, got " +
                                   std::to_string(*exp_val));
            }
        } break;
        case exp_mode::binary_iec: {
            if (!is_multiple_of(*exp_val, 10)) {
                throw config_error("exponent value must be a multiple of 10 for binary IEC mode, got " +
                                   std::to_string(*exp_val));
            }
        } break;
        case exp_mode::scientific:
        case exp_mode::binary: break;
    }
}

void validate_options(const resolved_options& opts) {
    if (opts.ndigits) { check_digit_place("number of digits", *opts.ndigits); }
    if (opts.round_mode == round_mode::sig_fig && opts.ndigits && *opts.ndigits < 1) {
        throw config_error("number of significant figures must be at least 1, got " + std::to_string(*opts.ndigits));
    }

    validate_exp_val(opts.exp_mode, opts.exp_val);

    if ((opts.upper_separator == upper_separator::point && opts.decimal_separator == decimal_separator::point) ||
        (opts.upper_separator == upper_separator::comma && opts.decimal_separator == decimal_separator::comma)) {
        throw config_error("upper separator and decimal separator must differ");
    }

    check_digit_place("left pad decimal place", opts.left_pad_dec_place);
    if (opts.left_pad_dec_place < 0) {
        throw config_error("left pad decimal place must be non-negative, got " +
                           std::to_string(opts.left_pad_dec_place));
    }
}

}  // namespace scifmt

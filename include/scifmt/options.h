#pragma once

#include "modes.h"
#include "prefix.h"

#include <optional>

namespace scifmt {

// Explicit exponent value or digit count; `std::nullopt` stands for `auto`
using auto_or_int = std::optional<int>;

// Partial option set: unset fields are taken from the next layer when resolved
struct user_options {
    std::optional<scifmt::exp_mode> exp_mode;
    std::optional<auto_or_int> exp_val;
    std::optional<scifmt::round_mode> round_mode;
    std::optional<auto_or_int> ndigits;
    std::optional<scifmt::upper_separator> upper_separator;
    std::optional<scifmt::decimal_separator> decimal_separator;
    std::optional<scifmt::lower_separator> lower_separator;
    std::optional<scifmt::sign_mode> sign_mode;
    std::optional<scifmt::left_pad_char> left_pad_char;
    std::optional<int> left_pad_dec_place;
    std::optional<scifmt::exp_format> exp_format;
    std::optional<prefix_table> extra_si_prefixes;
    std::optional<prefix_table> extra_iec_prefixes;
    std::optional<prefix_table> extra_parts_per_forms;
    std::optional<bool> capitalize;
    std::optional<bool> superscript;
    std::optional<bool> latex;
    std::optional<bool> nan_inf_exp;
    std::optional<bool> paren_uncertainty;
    std::optional<bool> pdg_sig_figs;
    std::optional<bool> left_pad_matching;
    std::optional<bool> paren_uncertainty_trim;
    std::optional<bool> pm_whitespace;

    // Not resolved themselves: they extend the extra prefix tables
    std::optional<bool> add_c_prefix;
    std::optional<bool> add_small_si_prefixes;
    std::optional<bool> add_ppth_form;

    // Fields set in `other` override fields of this set
    SCIFMT_EXPORT user_options& merge(const user_options& other);
};

// Fully populated option set
struct resolved_options {
    scifmt::exp_mode exp_mode = scifmt::exp_mode::fixed_point;
    auto_or_int exp_val;
    scifmt::round_mode round_mode = scifmt::round_mode::sig_fig;
    auto_or_int ndigits;
    scifmt::upper_separator upper_separator = scifmt::upper_separator::none;
    scifmt::decimal_separator decimal_separator = scifmt::decimal_separator::point;
    scifmt::lower_separator lower_separator = scifmt::lower_separator::none;
    scifmt::sign_mode sign_mode = scifmt::sign_mode::negative;
    scifmt::left_pad_char left_pad_char = scifmt::left_pad_char::space;
    int left_pad_dec_place = 0;
    scifmt::exp_format exp_format = scifmt::exp_format::standard;
    prefix_table extra_si_prefixes;
    prefix_table extra_iec_prefixes;
    prefix_table extra_parts_per_forms;
    bool capitalize = false;
    bool superscript = false;
    bool latex = false;
    bool nan_inf_exp = false;
    bool paren_uncertainty = false;
    bool pdg_sig_figs = false;
    bool left_pad_matching = false;
    bool paren_uncertainty_trim = true;
    bool pm_whitespace = true;
};

// Built-in defaults as a complete `user_options` set
SCIFMT_EXPORT const user_options& builtin_defaults();

// Merges `user` over `defaults`, applies the `add_*` flags and validates the result
SCIFMT_EXPORT resolved_options populate_options(const user_options& user, const user_options& defaults);
inline resolved_options populate_options(const user_options& user) {
    return populate_options(user, builtin_defaults());
}

// Throws `config_error` on inconsistent options
SCIFMT_EXPORT void validate_options(const resolved_options& opts);

SCIFMT_EXPORT void validate_exp_val(exp_mode mode, const auto_or_int& exp_val);

}  // namespace scifmt

#pragma once

#include "decimal.h"
#include "exponent.h"
#include "options.h"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace scifmt {

// Escapes parentheses, `%`, `_` and non-finite tokens for LaTeX math mode
SCIFMT_EXPORT std::string latex_translate(std::string_view s);

// Result of formatting: mantissa text and exponent suffix, kept apart so that
// every rendering is built from the same content
class formatted_number {
 public:
    formatted_number() = default;
    SCIFMT_EXPORT formatted_number(std::string body, exp_suffix suffix, bool wrap_with_suffix, resolved_options opts,
                                   decimal value, std::optional<decimal> uncertainty = std::nullopt);

    // Primary rendering selected by `latex` and `superscript` options
    SCIFMT_EXPORT std::string str() const;
    SCIFMT_EXPORT std::string as_ascii() const;
    SCIFMT_EXPORT std::string as_html() const;
    SCIFMT_EXPORT std::string as_latex(bool strip_math_mode = false) const;
    SCIFMT_EXPORT std::string render(rendering r) const;

    const std::string& body() const noexcept { return body_; }
    const exp_suffix& suffix() const noexcept { return suffix_; }
    const resolved_options& options() const noexcept { return opts_; }
    const decimal& value() const noexcept { return value_; }
    const std::optional<decimal>& uncertainty() const noexcept { return uncertainty_; }

    const std::vector<std::string>& warnings() const noexcept { return warnings_; }
    void add_warning(std::string message) { warnings_.emplace_back(std::move(message)); }

    friend bool operator==(const formatted_number& lhs, const std::string& rhs) { return lhs.str() == rhs; }
    friend bool operator!=(const formatted_number& lhs, const std::string& rhs) { return lhs.str() != rhs; }
    friend std::ostream& operator<<(std::ostream& os, const formatted_number& num) { return os << num.str(); }

 private:
    std::string body_;
    exp_suffix suffix_;
    bool wrap_with_suffix_ = false;
    resolved_options opts_;
    decimal value_;
    std::optional<decimal> uncertainty_;
    std::vector<std::string> warnings_;
};

}  // namespace scifmt

#include "scifmt/formatted_number.h"

#include "scifmt/stringalg.h"

#include <array>
#include <utility>

namespace scifmt {

std::string latex_translate(std::string_view s) {
    static const std::array<std::pair<std::string_view, std::string_view>, 8> replacements{{
        {"(", "\\left("},
        {")", "\\right)"},
        {"%", "\\%"},
        {"_", "\\_"},
        {"nan", "\\text{nan}"},
        {"NAN", "\\text{NAN}"},
        {"inf", "\\text{inf}"},
        {"INF", "\\text{INF}"},
    }};
    std::string result(s);
    for (const auto& r : replacements) { result = replace_strings(result, r.first, r.second); }
    return result;
}

formatted_number::formatted_number(std::string body, exp_suffix suffix, bool wrap_with_suffix, resolved_options opts,
                                   decimal value, std::optional<decimal> uncertainty)
    : body_(std::move(body)), suffix_(std::move(suffix)), wrap_with_suffix_(wrap_with_suffix), opts_(std::move(opts)),
      value_(std::move(value)), uncertainty_(std::move(uncertainty)) {}

std::string formatted_number::render(rendering r) const {
    std::string body = body_;
    if (r == rendering::ascii) {
        body = replace_strings(body, "±", "+/-");
    } else if (r == rendering::latex) {
        body = replace_strings(body, "±", "\\pm");
    }

    const std::string suffix = render_exp_suffix(suffix_, r);
    if (wrap_with_suffix_ && !suffix.empty()) { body = '(' + body + ')'; }
    if (r == rendering::latex) { body = latex_translate(body); }
    return body + suffix;
}

std::string formatted_number::str() const {
    if (opts_.latex) { return render(rendering::latex); }
    return render(opts_.superscript ? rendering::superscript : rendering::plain);
}

std::string formatted_number::as_ascii() const { return render(rendering::ascii); }

std::string formatted_number::as_html() const { return render(rendering::html); }

std::string formatted_number::as_latex(bool strip_math_mode) const {
    std::string s = render(rendering::latex);
    return strip_math_mode ? s : '$' + s + '$';
}

}  // namespace scifmt

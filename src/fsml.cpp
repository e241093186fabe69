#include "scifmt/fsml.h"

#include "scifmt/chars.h"
#include "scifmt/exception.h"

#include <array>
#include <charconv>

namespace scifmt {

namespace {

enum class group_t : unsigned {
    fill = 0,
    sign,
    alternate,
    pad_place,
    upper_separator,
    decimal_separator,
    lower_separator,
    round,
    exp_mode,
    exp_val,
    prefix,
    paren_uncertainty,
    count
};

constexpr unsigned group_count = static_cast<unsigned>(group_t::count);

// Groups are matched in order, each tried present before absent, so the first complete
// match is the one a leftmost-greedy regular expression engine would report
class spec_matcher {
 public:
    explicit spec_matcher(std::string_view spec) : spec_(spec) {}

    bool match() { return match_from(0, 0); }

    bool has(group_t g) const { return !groups_[static_cast<unsigned>(g)].empty(); }
    std::string_view group(group_t g) const { return groups_[static_cast<unsigned>(g)]; }

 private:
    std::string_view spec_;
    std::array<std::string_view, group_count> groups_{};

    bool is_one_of(std::size_t pos, std::string_view chars) const {
        return pos < spec_.size() && chars.find(spec_[pos]) != std::string_view::npos;
    }

    std::size_t skip_digits(std::size_t pos) const {
        while (pos < spec_.size() && is_digit(spec_[pos])) { ++pos; }
        return pos;
    }

    // `[+-]?\d+` starting at `pos`; returns the end or `npos`
    std::size_t match_integer(std::size_t pos) const {
        if (is_one_of(pos, "+-")) { ++pos; }
        const std::size_t end = skip_digits(pos);
        return end != pos ? end : std::string_view::npos;
    }

    // End of group `g` present at `pos`, or `npos`
    std::size_t match_group(group_t g, std::size_t pos) const {
        const std::size_t npos = std::string_view::npos;
        switch (g) {
            case group_t::fill: return is_one_of(pos, " 0") && is_one_of(pos + 1, "=") ? pos + 2 : npos;
            case group_t::sign: return is_one_of(pos, "-+ ") ? pos + 1 : npos;
            case group_t::alternate: return is_one_of(pos, "#") ? pos + 1 : npos;
            case group_t::pad_place: {
                const std::size_t end = skip_digits(pos);
                return end != pos ? end : npos;
            }
            case group_t::upper_separator: return is_one_of(pos, "n,.s_") ? pos + 1 : npos;
            case group_t::decimal_separator: return is_one_of(pos, ".,") ? pos + 1 : npos;
            case group_t::lower_separator: return is_one_of(pos, "ns_") ? pos + 1 : npos;
            case group_t::round: return is_one_of(pos, ".!") ? match_integer(pos + 1) : npos;
            case group_t::exp_mode: return is_one_of(pos, "fF%eErRbB") ? pos + 1 : npos;
            case group_t::exp_val: return is_one_of(pos, "x") ? match_integer(pos + 1) : npos;
            case group_t::prefix: return is_one_of(pos, "p") ? pos + 1 : npos;
            case group_t::paren_uncertainty: return spec_.compare(pos, 2, "()") == 0 ? pos + 2 : npos;
            case group_t::count: break;
        }
        return npos;
    }

    bool match_from(unsigned g, std::size_t pos) {
        if (g == group_count) { return pos == spec_.size(); }
        const std::size_t end = match_group(static_cast<group_t>(g), pos);
        if (end != std::string_view::npos) {
            groups_[g] = spec_.substr(pos, end - pos);
            if (match_from(g + 1, end)) { return true; }
        }
        groups_[g] = std::string_view();
        return match_from(g + 1, pos);
    }
};

int parse_int(std::string_view spec, std::string_view s) {
    if (!s.empty() && s[0] == '+') { s.remove_prefix(1); }
    int val = 0;
    const auto result = std::from_chars(s.data(), s.data() + s.size(), val);
    if (result.ec != std::errc{} || result.ptr != s.data() + s.size()) {
        throw parse_error(spec, "integer out of range in format specifier");
    }
    return val;
}

}  // namespace

user_options parse_format_spec(std::string_view spec) {
    spec_matcher m(spec);
    if (!m.match()) { throw parse_error(spec, "invalid format specifier"); }

    user_options opts;
    if (m.has(group_t::fill)) {
        opts.left_pad_char = m.group(group_t::fill)[0] == '0' ? left_pad_char::zero : left_pad_char::space;
    }

    if (m.has(group_t::sign)) {
        switch (m.group(group_t::sign)[0]) {
            case '+': opts.sign_mode = sign_mode::always; break;
            case ' ': opts.sign_mode = sign_mode::space; break;
            default: opts.sign_mode = sign_mode::negative; break;
        }
    }

    if (m.has(group_t::pad_place)) {
        opts.left_pad_dec_place = parse_int(spec, m.group(group_t::pad_place));
        opts.left_pad_matching = true;
    }

    if (m.has(group_t::upper_separator)) {
        switch (m.group(group_t::upper_separator)[0]) {
            case ',': opts.upper_separator = upper_separator::comma; break;
            case '.': opts.upper_separator = upper_separator::point; break;
            case 's': opts.upper_separator = upper_separator::space; break;
            case '_': opts.upper_separator = upper_separator::underscore; break;
            default: opts.upper_separator = upper_separator::none; break;
        }
    }

    if (m.has(group_t::decimal_separator)) {
        opts.decimal_separator = m.group(group_t::decimal_separator)[0] == ',' ? decimal_separator::comma :
                                                                                  decimal_separator::point;
    }

    if (m.has(group_t::lower_separator)) {
        switch (m.group(group_t::lower_separator)[0]) {
            case 's': opts.lower_separator = lower_separator::space; break;
            case '_': opts.lower_separator = lower_separator::underscore; break;
            default: opts.lower_separator = lower_separator::none; break;
        }
    }

    if (m.has(group_t::round)) {
        const std::string_view round = m.group(group_t::round);
        opts.round_mode = round[0] == '!' ? round_mode::sig_fig : round_mode::dec_place;
        opts.ndigits.emplace(parse_int(spec, round.substr(1)));
    }

    if (m.has(group_t::exp_mode)) {
        const char ch = m.group(group_t::exp_mode)[0];
        const bool alternate = m.has(group_t::alternate);
        opts.capitalize = is_upper(ch);
        switch (to_lower(ch)) {
            case 'f': opts.exp_mode = exp_mode::fixed_point; break;
            case '%': opts.exp_mode = exp_mode::percent; break;
            case 'e': opts.exp_mode = exp_mode::scientific; break;
            case 'r': opts.exp_mode = alternate ? exp_mode::engineering_shifted : exp_mode::engineering; break;
            case 'b': opts.exp_mode = alternate ? exp_mode::binary_iec : exp_mode::binary; break;
            default: SCIFMT_UNREACHABLE_CODE;
        }
    }

    if (m.has(group_t::exp_val)) { opts.exp_val.emplace(parse_int(spec, m.group(group_t::exp_val).substr(1))); }
    if (m.has(group_t::prefix)) { opts.exp_format = exp_format::prefix; }
    if (m.has(group_t::paren_uncertainty)) { opts.paren_uncertainty = true; }
    return opts;
}

}  // namespace scifmt

#include "scifmt/rounding.h"

#include "scifmt/chars.h"

namespace scifmt {

int get_pdg_round_digit(const decimal& x) {
    const int top = top_digit(x);
    if (!x.is_finite() || x.is_zero()) { return top; }

    // leading three significant digits, truncated
    const std::string& digs = x.coefficient();
    unsigned lead = 0;
    for (std::size_t i = 0; i < 3; ++i) { lead = 10 * lead + (i < digs.size() ? dig_v(digs[i]) : 0); }

    if (lead <= 354) { return top - 1; }
    return top;  // 355-949 keeps one digit, 950-999 carries into a leading `10`
}

int get_round_digit(const decimal& x, round_mode mode, const auto_or_int& ndigits, bool pdg_sig_figs) {
    switch (mode) {
        case round_mode::sig_fig: {
            if (ndigits) { return top_digit(x) - (*ndigits - 1); }
            return pdg_sig_figs ? get_pdg_round_digit(x) : bottom_digit(x);
        } break;
        case round_mode::dec_place: return ndigits ? -*ndigits : bottom_digit(x);
    }
    SCIFMT_UNREACHABLE_CODE;
}

}  // namespace scifmt

#pragma once

#include "decimal.h"
#include "options.h"

namespace scifmt {

// Particle Data Group 3-5-4 rule: one or two significant figures depending on the leading three digits
SCIFMT_EXPORT int get_pdg_round_digit(const decimal& x);

// Decimal place to round `x` to
SCIFMT_EXPORT int get_round_digit(const decimal& x, round_mode mode, const auto_or_int& ndigits, bool pdg_sig_figs);

// `x` rounded to the 10^place digit; non-finite values pass through
inline decimal round_to_digit(const decimal& x, int place) { return x.quantize(place); }

}  // namespace scifmt

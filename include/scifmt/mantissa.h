#pragma once

#include "decimal.h"
#include "modes.h"

#include <string>
#include <string_view>

namespace scifmt {

// `-` for negative values, `+` or ` ` for positive values by mode; zero and NaN get ` ` unless `negative`
SCIFMT_EXPORT std::string get_sign_str(const decimal& x, sign_mode mode);

SCIFMT_EXPORT std::string get_pad_str(char pad_char, int top, int target_top);

// sign + pad + |x| printed down to the `target_bottom` place; non-finite values print as `nan` or `inf`
SCIFMT_EXPORT std::string format_num_by_top_bottom_dig(const decimal& x, int target_top, int target_bottom,
                                                       sign_mode mode, char pad_char);

// Groups digits by three on both sides of the point and substitutes the decimal separator
SCIFMT_EXPORT std::string add_separators(std::string_view s, upper_separator upper, decimal_separator dec,
                                         lower_separator lower);

}  // namespace scifmt

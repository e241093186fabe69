#pragma once

#include "options.h"

#include <string_view>

namespace scifmt {

// Compiles a format specification such as `0=2,._!3Rp()` into a partial option set:
//
//   [fill=][sign][#][padplace][upper][decimal][lower][roundmode digits][expmode][x expval][p][()]
//
// Every group is optional; absent groups leave their options unset. Throws `parse_error` on mismatch.
SCIFMT_EXPORT user_options parse_format_spec(std::string_view spec);

}  // namespace scifmt

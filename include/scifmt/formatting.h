#pragma once

#include "formatted_number.h"

namespace scifmt {

SCIFMT_EXPORT formatted_number format(const decimal& value, const resolved_options& opts);

// Value and uncertainty rounded together and rendered with a shared exponent
SCIFMT_EXPORT formatted_number format(const decimal& value, const decimal& uncertainty, const resolved_options& opts);

}  // namespace scifmt

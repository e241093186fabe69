#include "scifmt/number.h"

namespace scifmt {

formatted_number number::format(std::string_view spec) const { return format(formatter::from_format_spec(spec)); }

formatted_number number::format(const formatter& fmt) const {
    return uncertainty_ ? fmt(value_, *uncertainty_) : fmt(value_);
}

}  // namespace scifmt

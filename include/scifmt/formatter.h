#pragma once

#include "defaults.h"
#include "formatting.h"

#include <string_view>

namespace scifmt {

// Formats values and value/uncertainty pairs with a fixed set of user options. Options left
// unset are taken from `defaults_registry` at format time.
class formatter {
 public:
    SCIFMT_EXPORT formatter();
    SCIFMT_EXPORT explicit formatter(user_options opts);

    SCIFMT_EXPORT static formatter from_format_spec(std::string_view spec);

    const user_options& input_options() const noexcept { return opts_; }
    SCIFMT_EXPORT resolved_options populated_options() const;

    SCIFMT_EXPORT formatted_number operator()(const decimal& value) const;
    SCIFMT_EXPORT formatted_number operator()(const decimal& value, const decimal& uncertainty) const;
    formatted_number operator()(double value) const { return (*this)(decimal::from_double(value)); }
    formatted_number operator()(double value, double uncertainty) const {
        return (*this)(decimal::from_double(value), decimal::from_double(uncertainty));
    }

 private:
    user_options opts_;

    formatted_number report(formatted_number result) const;
};

}  // namespace scifmt

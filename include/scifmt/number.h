#pragma once

#include "formatter.h"

#include <optional>
#include <string_view>

namespace scifmt {

// Value with an optional uncertainty, formatted through a format specification
class number {
 public:
    explicit number(decimal value) : value_(std::move(value)) {}
    number(decimal value, decimal uncertainty) : value_(std::move(value)), uncertainty_(std::move(uncertainty)) {}
    explicit number(double value) : value_(decimal::from_double(value)) {}
    number(double value, double uncertainty)
        : value_(decimal::from_double(value)), uncertainty_(decimal::from_double(uncertainty)) {}

    const decimal& value() const noexcept { return value_; }
    const std::optional<decimal>& uncertainty() const noexcept { return uncertainty_; }

    SCIFMT_EXPORT formatted_number format(std::string_view spec = {}) const;
    SCIFMT_EXPORT formatted_number format(const formatter& fmt) const;

 private:
    decimal value_;
    std::optional<decimal> uncertainty_;
};

}  // namespace scifmt

#pragma once

#include "common.h"

#include <limits>
#include <string>
#include <string_view>

namespace scifmt {

// Exact base-10 number: (-1)^sign * coefficient * 10^exponent, plus NaN and signed infinity.
// Trailing zeroes of the coefficient are significant, so `1.20` and `1.2` differ in `bottom_digit`.
class decimal {
 public:
    enum class kind : std::uint8_t { finite = 0, nan, infinity };

    // Bound on exponents and digit places, so their sums and negations stay inside `int`
    static constexpr int max_exponent = std::numeric_limits<int>::max() / 4;

    decimal() noexcept = default;
    explicit decimal(long long val);
    explicit decimal(unsigned long long val);
    explicit decimal(int val) : decimal(static_cast<long long>(val)) {}
    explicit decimal(unsigned val) : decimal(static_cast<unsigned long long>(val)) {}

    // Converts through the shortest decimal text which round-trips to `val`
    SCIFMT_EXPORT static decimal from_double(double val);
    SCIFMT_EXPORT static decimal parse(std::string_view s);
    static decimal nan() noexcept { return decimal(kind::nan, false); }
    static decimal infinity(bool negative = false) noexcept { return decimal(kind::infinity, negative); }

    kind get_kind() const noexcept { return kind_; }
    bool is_finite() const noexcept { return kind_ == kind::finite; }
    bool is_nan() const noexcept { return kind_ == kind::nan; }
    bool is_infinite() const noexcept { return kind_ == kind::infinity; }
    bool is_zero() const noexcept { return kind_ == kind::finite && coeff_ == "0"; }
    bool signbit() const noexcept { return neg_; }

    // -1, 0 or +1; NaN and zeroes of either sign give 0
    int sign() const noexcept {
        if (is_nan() || is_zero()) { return 0; }
        return neg_ ? -1 : 1;
    }

    const std::string& coefficient() const noexcept { return coeff_; }
    int exponent() const noexcept { return exp_; }

    SCIFMT_EXPORT decimal abs() const;
    SCIFMT_EXPORT decimal operator-() const;

    // Strips trailing zeroes from the coefficient
    SCIFMT_EXPORT decimal normalize() const;

    // Rounds to a multiple of 10^place, ties to even; result has exactly `place` as its exponent
    SCIFMT_EXPORT decimal quantize(int place) const;

    SCIFMT_EXPORT decimal scaleb(int n) const;

    // Multiplies by 2^n; exact for negative `n` too, since 2^-n == 5^n * 10^-n
    SCIFMT_EXPORT decimal mul_pow2(int n) const;

    // |x| with exactly `prec` digits after the point, ties to even
    SCIFMT_EXPORT std::string to_fixed(int prec) const;

    SCIFMT_EXPORT std::string to_string() const;

    // Total order on finite values; non-finite operands are compared by kind only
    SCIFMT_EXPORT int compare(const decimal& other) const;
    SCIFMT_EXPORT int compare_abs(const decimal& other) const;

    friend bool operator==(const decimal& lhs, const decimal& rhs) { return lhs.compare(rhs) == 0; }
    friend bool operator!=(const decimal& lhs, const decimal& rhs) { return lhs.compare(rhs) != 0; }
    friend bool operator<(const decimal& lhs, const decimal& rhs) { return lhs.compare(rhs) < 0; }
    friend bool operator<=(const decimal& lhs, const decimal& rhs) { return lhs.compare(rhs) <= 0; }
    friend bool operator>(const decimal& lhs, const decimal& rhs) { return lhs.compare(rhs) > 0; }
    friend bool operator>=(const decimal& lhs, const decimal& rhs) { return lhs.compare(rhs) >= 0; }

 private:
    kind kind_ = kind::finite;
    bool neg_ = false;
    std::string coeff_{"0"};
    int exp_ = 0;

    decimal(kind k, bool neg) : kind_(k), neg_(neg) {}
    decimal(bool neg, std::string coeff, int exp);
};

// --------------------------

// Place of the most significant digit; 0 for zero and non-finite values
SCIFMT_EXPORT int top_digit(const decimal& x) noexcept;

// Place of the least significant digit of the exact representation; 0 for non-finite values
SCIFMT_EXPORT int bottom_digit(const decimal& x) noexcept;

// floor(log2(|x|)); 0 for zero and non-finite values
SCIFMT_EXPORT int top_digit_binary(const decimal& x);

}  // namespace scifmt

#include "scifmt/decimal.h"

#include "scifmt/chars.h"
#include "scifmt/exception.h"
#include "scifmt/stringalg.h"

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <limits>

namespace scifmt {

inline void trim_leading_zeros(std::string& digs) {
    const auto pos = digs.find_first_not_of('0');
    if (pos == std::string::npos) {
        digs.assign(1, '0');
    } else if (pos > 0) {
        digs.erase(0, pos);
    }
}

// digs = digs * mul, digits stored most significant first
static void mul_small(std::string& digs, std::uint32_t mul) {
    std::uint64_t carry = 0;
    for (auto it = digs.rbegin(); it != digs.rend(); ++it) {
        const std::uint64_t v = static_cast<std::uint64_t>(*it - '0') * mul + carry;
        *it = static_cast<char>('0' + v % 10), carry = v / 10;
    }
    std::array<char, 24> buf;
    char* p = buf.data() + buf.size();
    while (carry) { *--p = static_cast<char>('0' + carry % 10), carry /= 10; }
    digs.insert(digs.begin(), p, buf.data() + buf.size());
    trim_leading_zeros(digs);
}

// digs = digs + 1
static void increment(std::string& digs) {
    for (auto it = digs.rbegin(); it != digs.rend(); ++it) {
        if (*it != '9') {
            ++*it;
            return;
        }
        *it = '0';
    }
    digs.insert(digs.begin(), '1');
}

// --------------------------

decimal::decimal(bool neg, std::string coeff, int exp) : neg_(neg), coeff_(std::move(coeff)), exp_(exp) {
    trim_leading_zeros(coeff_);
}

decimal::decimal(long long val) : neg_(val < 0) {
    const unsigned long long u = neg_ ? 0ull - static_cast<unsigned long long>(val) :
                                        static_cast<unsigned long long>(val);
    coeff_ = std::to_string(u);
}

decimal::decimal(unsigned long long val) : coeff_(std::to_string(val)) {}

decimal decimal::from_double(double val) {
    if (std::isnan(val)) { return nan(); }
    if (std::isinf(val)) { return infinity(val < 0); }
    std::array<char, 64> buf;
    const auto result = std::to_chars(buf.data(), buf.data() + buf.size(), val);
    if (result.ec != std::errc{}) { throw format_error("cannot convert floating-point value to decimal"); }
    return parse(std::string_view(buf.data(), result.ptr - buf.data()));
}

decimal decimal::parse(std::string_view s) {
    std::string_view body = trim_string(s);

    bool neg = false;
    if (!body.empty() && (body[0] == '+' || body[0] == '-')) {
        neg = body[0] == '-';
        body.remove_prefix(1);
    }

    if (compare_strings_nocase(body, "nan") == 0) { return nan(); }
    if (compare_strings_nocase(body, "inf") == 0 || compare_strings_nocase(body, "infinity") == 0) {
        return infinity(neg);
    }

    auto p = body.begin();
    const auto end = body.end();
    std::string coeff;
    int exp = 0;
    bool has_digits = false;
    for (; p != end && is_digit(*p); ++p) { coeff += *p, has_digits = true; }
    if (p != end && *p == '.') {
        for (++p; p != end && is_digit(*p); ++p) { coeff += *p, --exp, has_digits = true; }
    }
    if (!has_digits) { throw format_error("invalid decimal literal '" + std::string(s) + "'"); }

    if (p != end && (*p == 'e' || *p == 'E')) {
        bool exp_neg = false;
        if (++p != end && (*p == '+' || *p == '-')) { exp_neg = *p++ == '-'; }
        if (p == end || !is_digit(*p)) { throw format_error("invalid decimal literal '" + std::string(s) + "'"); }
        long exp_val = 0;
        for (; p != end && is_digit(*p); ++p) {
            exp_val = 10 * exp_val + static_cast<long>(dig_v(*p));
            if (exp_val > max_exponent) { throw format_error("decimal exponent overflow"); }
        }
        exp += static_cast<int>(exp_neg ? -exp_val : exp_val);
    }
    if (p != end) { throw format_error("invalid decimal literal '" + std::string(s) + "'"); }
    return decimal(neg, std::move(coeff), exp);
}

// --------------------------

decimal decimal::abs() const {
    decimal result(*this);
    result.neg_ = false;
    return result;
}

decimal decimal::operator-() const {
    decimal result(*this);
    if (!is_nan()) { result.neg_ = !neg_; }
    return result;
}

decimal decimal::normalize() const {
    if (!is_finite()) { return *this; }
    if (is_zero()) { return decimal(); }
    decimal result(*this);
    const auto pos = result.coeff_.find_last_not_of('0');
    result.exp_ += static_cast<int>(result.coeff_.size() - pos - 1);
    result.coeff_.erase(pos + 1);
    return result;
}

decimal decimal::quantize(int place) const {
    if (!is_finite()) { return *this; }
    decimal result(*this);
    if (exp_ >= place) {
        if (!is_zero()) { result.coeff_.append(static_cast<std::size_t>(exp_ - place), '0'); }
        result.exp_ = place;
        return result;
    }

    const std::size_t n_drop = static_cast<std::size_t>(place - exp_);
    const std::size_t len = coeff_.size();
    result.exp_ = place;
    if (n_drop > len) {  // whole coefficient is below half a unit of `place`
        result.coeff_.assign(1, '0');
        return result;
    }

    std::string kept = coeff_.substr(0, len - n_drop);
    const char first_dropped = coeff_[len - n_drop];
    bool round_up = false;
    if (first_dropped > '5') {
        round_up = true;
    } else if (first_dropped == '5') {
        const bool exact_half = coeff_.find_first_not_of('0', len - n_drop + 1) == std::string::npos;
        round_up = !exact_half || (!kept.empty() && ((kept.back() - '0') & 1));
    }
    if (kept.empty()) { kept.assign(1, '0'); }
    if (round_up) { increment(kept); }
    trim_leading_zeros(kept);
    result.coeff_ = std::move(kept);
    return result;
}

decimal decimal::scaleb(int n) const {
    if (!is_finite()) { return *this; }
    decimal result(*this);
    result.exp_ += n;
    return result;
}

decimal decimal::mul_pow2(int n) const {
    if (!is_finite() || is_zero() || n == 0) { return *this; }
    const std::uint32_t mul = n > 0 ? 2 : 5;
    const unsigned chunk_pow = n > 0 ? 29 : 13;  // 2^29 and 5^13 fit 32 bits
    std::uint32_t chunk_mul = 1;
    for (unsigned i = 0; i < chunk_pow; ++i) { chunk_mul *= mul; }

    decimal result(*this);
    unsigned count = static_cast<unsigned>(n > 0 ? n : -n);
    for (; count >= chunk_pow; count -= chunk_pow) { mul_small(result.coeff_, chunk_mul); }
    std::uint32_t tail_mul = 1;
    while (count--) { tail_mul *= mul; }
    if (tail_mul != 1) { mul_small(result.coeff_, tail_mul); }
    if (n < 0) { result.exp_ += n; }
    return result;
}

// --------------------------

std::string decimal::to_fixed(int prec) const {
    if (is_nan()) { return "nan"; }
    if (is_infinite()) { return "inf"; }
    if (prec < 0) { prec = 0; }
    const decimal q = quantize(-prec);
    std::string digs = q.coeff_;
    const std::size_t n_frac = static_cast<std::size_t>(prec);
    if (digs.size() <= n_frac) { digs.insert(0, n_frac + 1 - digs.size(), '0'); }
    if (n_frac > 0) { digs.insert(digs.size() - n_frac, 1, '.'); }
    return digs;
}

std::string decimal::to_string() const {
    std::string s = neg_ ? "-" : "";
    if (is_nan()) { return "NaN"; }
    if (is_infinite()) { return s + "Infinity"; }
    const int adjusted = exp_ + static_cast<int>(coeff_.size()) - 1;
    if (exp_ <= 0 && adjusted >= -6) {
        const std::size_t n_frac = static_cast<std::size_t>(-exp_);
        std::string digs = coeff_;
        if (digs.size() <= n_frac) { digs.insert(0, n_frac + 1 - digs.size(), '0'); }
        if (n_frac > 0) { digs.insert(digs.size() - n_frac, 1, '.'); }
        return s + digs;
    }
    s += coeff_[0];
    if (coeff_.size() > 1) { s.append(1, '.').append(coeff_, 1, std::string::npos); }
    s += 'E';
    s += adjusted < 0 ? '-' : '+';
    return s + std::to_string(adjusted < 0 ? -adjusted : adjusted);
}

int decimal::compare_abs(const decimal& other) const {
    if (!is_finite() || !other.is_finite()) {
        return static_cast<int>(is_infinite()) - static_cast<int>(other.is_infinite());
    }
    if (is_zero() || other.is_zero()) { return static_cast<int>(!is_zero()) - static_cast<int>(!other.is_zero()); }
    const int top = top_digit(*this), other_top = top_digit(other);
    if (top != other_top) { return top < other_top ? -1 : 1; }
    const std::size_t len = std::max(coeff_.size(), other.coeff_.size());
    for (std::size_t i = 0; i < len; ++i) {
        const char a = i < coeff_.size() ? coeff_[i] : '0';
        const char b = i < other.coeff_.size() ? other.coeff_[i] : '0';
        if (a != b) { return a < b ? -1 : 1; }
    }
    return 0;
}

int decimal::compare(const decimal& other) const {
    if (!is_finite() || !other.is_finite()) {
        if (is_nan() || other.is_nan()) { return static_cast<int>(is_nan()) - static_cast<int>(other.is_nan()); }
        const int lhs = is_infinite() ? (neg_ ? -2 : 2) : sign();
        const int rhs = other.is_infinite() ? (other.neg_ ? -2 : 2) : other.sign();
        return lhs == rhs ? 0 : (lhs < rhs ? -1 : 1);
    }
    const int lhs_sign = sign(), rhs_sign = other.sign();
    if (lhs_sign != rhs_sign) { return lhs_sign < rhs_sign ? -1 : 1; }
    const int cmp = compare_abs(other);
    return lhs_sign < 0 ? -cmp : cmp;
}

// --------------------------

int top_digit(const decimal& x) noexcept {
    if (!x.is_finite() || x.is_zero()) { return 0; }
    return static_cast<int>(x.coefficient().size()) + x.exponent() - 1;
}

int bottom_digit(const decimal& x) noexcept { return x.is_finite() ? x.exponent() : 0; }

int top_digit_binary(const decimal& x) {
    if (!x.is_finite() || x.is_zero()) { return 0; }
    const decimal a = x.abs();

    // Estimate from the leading digits, then settle on the exact value by comparison
    const std::string& digs = a.coefficient();
    const std::size_t n_lead = std::min<std::size_t>(digs.size(), 17);
    const double lead = std::stod(digs.substr(0, n_lead));
    const int lead_exp = a.exponent() + static_cast<int>(digs.size() - n_lead);
    int exp = static_cast<int>(std::floor(std::log2(lead) + lead_exp * 3.321928094887362347870319429489));

    const decimal one(1);
    while (one.mul_pow2(exp) > a) { --exp; }
    while (one.mul_pow2(exp + 1) <= a) { ++exp; }
    return exp;
}

}  // namespace scifmt

#include "scifmt/exception.h"
#include "scifmt/exponent.h"

#include <gtest/gtest.h>

using scifmt::decimal;
using scifmt::exp_mode;
using scifmt::exp_suffix;
using scifmt::rendering;

namespace {

decimal dec(const char* s) { return decimal::parse(s); }

TEST(ExponentTest, AutoExponentByMode) {
    EXPECT_EQ(scifmt::resolve_exponent(dec("123.456"), exp_mode::fixed_point, std::nullopt), 0);
    EXPECT_EQ(scifmt::resolve_exponent(dec("123.456"), exp_mode::percent, std::nullopt), 0);
    EXPECT_EQ(scifmt::resolve_exponent(dec("123.456"), exp_mode::scientific, std::nullopt), 2);
    EXPECT_EQ(scifmt::resolve_exponent(dec("0.00062607"), exp_mode::scientific, std::nullopt), -4);
    EXPECT_EQ(scifmt::resolve_exponent(dec("12345.6"), exp_mode::engineering, std::nullopt), 3);
    EXPECT_EQ(scifmt::resolve_exponent(dec("0.00062607"), exp_mode::engineering, std::nullopt), -6);
    EXPECT_EQ(scifmt::resolve_exponent(dec("123.456"), exp_mode::engineering_shifted, std::nullopt), 3);
    EXPECT_EQ(scifmt::resolve_exponent(dec("12.3456"), exp_mode::engineering_shifted, std::nullopt), 0);
    EXPECT_EQ(scifmt::resolve_exponent(dec("1024"), exp_mode::binary, std::nullopt), 10);
    EXPECT_EQ(scifmt::resolve_exponent(dec("3145728"), exp_mode::binary_iec, std::nullopt), 20);
}

TEST(ExponentTest, AutoExponentsAreMultiplesOfStep) {
    for (int e = -40; e <= 40; ++e) {
        const decimal x = decimal::parse("3.7").scaleb(e);
        EXPECT_EQ(scifmt::resolve_exponent(x, exp_mode::engineering, std::nullopt) % 3, 0);
        EXPECT_EQ(scifmt::resolve_exponent(x, exp_mode::engineering_shifted, std::nullopt) % 3, 0);
        EXPECT_EQ(scifmt::resolve_exponent(x, exp_mode::binary_iec, std::nullopt) % 10, 0);
    }
}

TEST(ExponentTest, ZeroAndNonFiniteValues) {
    EXPECT_EQ(scifmt::resolve_exponent(decimal(0), exp_mode::scientific, std::nullopt), 0);
    EXPECT_EQ(scifmt::resolve_exponent(decimal(0), exp_mode::scientific, 6), 6);
    EXPECT_EQ(scifmt::resolve_exponent(decimal::nan(), exp_mode::engineering, std::nullopt), 0);
    EXPECT_EQ(scifmt::resolve_exponent(decimal::infinity(true), exp_mode::binary, std::nullopt), 0);
}

TEST(ExponentTest, FixedExponentIsValidated) {
    EXPECT_EQ(scifmt::resolve_exponent(dec("123.456"), exp_mode::scientific, -4), -4);
    EXPECT_EQ(scifmt::resolve_exponent(dec("123.456"), exp_mode::engineering, 6), 6);
    EXPECT_EQ(scifmt::resolve_exponent(dec("123.456"), exp_mode::fixed_point, 0), 0);
    EXPECT_THROW(scifmt::resolve_exponent(dec("123.456"), exp_mode::fixed_point, 3), scifmt::config_error);
    EXPECT_THROW(scifmt::resolve_exponent(dec("123.456"), exp_mode::percent, -2), scifmt::config_error);
    EXPECT_THROW(scifmt::resolve_exponent(dec("123.456"), exp_mode::engineering, 4), scifmt::config_error);
    EXPECT_THROW(scifmt::resolve_exponent(dec("123.456"), exp_mode::engineering_shifted, -2), scifmt::config_error);
    EXPECT_THROW(scifmt::resolve_exponent(dec("123.456"), exp_mode::binary_iec, 15), scifmt::config_error);
}

TEST(ExponentTest, MantissaExpBase) {
    auto split = scifmt::get_mantissa_exp_base(dec("123.456"), exp_mode::scientific, std::nullopt);
    EXPECT_EQ(split.mantissa.to_string(), "1.23456");
    EXPECT_EQ(split.exp, 2);
    EXPECT_EQ(split.base, 10);

    split = scifmt::get_mantissa_exp_base(decimal(1536), exp_mode::binary, std::nullopt);
    EXPECT_EQ(split.mantissa.to_string(), "1.5");
    EXPECT_EQ(split.exp, 10);
    EXPECT_EQ(split.base, 2);

    split = scifmt::get_mantissa_exp_base(dec("0.0012"), exp_mode::scientific, 1);
    EXPECT_EQ(split.mantissa.to_string(), "0.00012");
    EXPECT_EQ(split.exp, 1);
}

TEST(ExponentTest, StandardExponentText) {
    EXPECT_EQ(scifmt::standard_exp_str(10, 3, false), "e+03");
    EXPECT_EQ(scifmt::standard_exp_str(10, -12, true), "E-12");
    EXPECT_EQ(scifmt::standard_exp_str(10, 0, false), "e+00");
    EXPECT_EQ(scifmt::standard_exp_str(10, 100, false), "e+100");
    EXPECT_EQ(scifmt::standard_exp_str(2, 10, false), "b+10");
    EXPECT_EQ(scifmt::standard_exp_str(2, -3, true), "B-03");
}

TEST(ExponentTest, SuperscriptExponentText) {
    EXPECT_EQ(scifmt::superscript_exp_str(10, 3), "×10³");
    EXPECT_EQ(scifmt::superscript_exp_str(10, -3), "×10⁻³");
    EXPECT_EQ(scifmt::superscript_exp_str(10, 0), "×10⁰");
    EXPECT_EQ(scifmt::superscript_exp_str(10, 15), "×10¹⁵");
    EXPECT_EQ(scifmt::superscript_exp_str(2, 12), "×2¹²");
}

TEST(ExponentTest, SuffixRenderings) {
    exp_suffix suffix;
    suffix.type = exp_suffix::kind::standard;
    suffix.exp = -3;
    EXPECT_EQ(scifmt::render_exp_suffix(suffix, rendering::plain), "e-03");
    EXPECT_EQ(scifmt::render_exp_suffix(suffix, rendering::ascii), "e-03");
    EXPECT_EQ(scifmt::render_exp_suffix(suffix, rendering::superscript), "×10⁻³");
    EXPECT_EQ(scifmt::render_exp_suffix(suffix, rendering::html), "×10<sup>-3</sup>");
    EXPECT_EQ(scifmt::render_exp_suffix(suffix, rendering::latex), "\\times 10^{-3}");

    suffix.type = exp_suffix::kind::percent;
    EXPECT_EQ(scifmt::render_exp_suffix(suffix, rendering::plain), "%");
    EXPECT_EQ(scifmt::render_exp_suffix(suffix, rendering::latex), "\\%");

    suffix.type = exp_suffix::kind::prefix;
    suffix.prefix = "μ";
    EXPECT_EQ(scifmt::render_exp_suffix(suffix, rendering::plain), " μ");
    EXPECT_EQ(scifmt::render_exp_suffix(suffix, rendering::ascii), " u");
    EXPECT_EQ(scifmt::render_exp_suffix(suffix, rendering::html), " μ");
    EXPECT_EQ(scifmt::render_exp_suffix(suffix, rendering::latex), "\\text{ μ}");

    suffix.type = exp_suffix::kind::none;
    EXPECT_EQ(scifmt::render_exp_suffix(suffix, rendering::superscript), "");
}

TEST(ExponentTest, PrefixSubstitution) {
    scifmt::resolved_options opts;
    opts.exp_format = scifmt::exp_format::prefix;

    exp_suffix suffix = scifmt::make_exp_suffix(exp_mode::engineering, -3, opts);
    EXPECT_EQ(suffix.type, exp_suffix::kind::prefix);
    EXPECT_EQ(suffix.prefix, "m");

    suffix = scifmt::make_exp_suffix(exp_mode::engineering, 0, opts);
    EXPECT_EQ(suffix.type, exp_suffix::kind::none);

    // no prefix for 10^-2 unless requested
    suffix = scifmt::make_exp_suffix(exp_mode::scientific, -2, opts);
    EXPECT_EQ(suffix.type, exp_suffix::kind::standard);
    EXPECT_EQ(scifmt::render_exp_suffix(suffix, rendering::plain), "e-02");

    suffix = scifmt::make_exp_suffix(exp_mode::binary_iec, 10, opts);
    EXPECT_EQ(suffix.type, exp_suffix::kind::prefix);
    EXPECT_EQ(suffix.prefix, "Ki");
    EXPECT_EQ(suffix.base, 2);

    opts.exp_format = scifmt::exp_format::parts_per;
    suffix = scifmt::make_exp_suffix(exp_mode::engineering, -6, opts);
    EXPECT_EQ(suffix.prefix, "ppm");
    suffix = scifmt::make_exp_suffix(exp_mode::engineering, -3, opts);
    EXPECT_EQ(suffix.type, exp_suffix::kind::standard);
}

TEST(ExponentTest, ExtraPrefixesOverrideAndSuppress) {
    scifmt::resolved_options opts;
    opts.exp_format = scifmt::exp_format::prefix;
    opts.extra_si_prefixes = {{-3, std::nullopt}, {3, std::string("K")}, {-2, std::string("c")}};

    exp_suffix suffix = scifmt::make_exp_suffix(exp_mode::engineering, -3, opts);
    EXPECT_EQ(suffix.type, exp_suffix::kind::standard);
    EXPECT_EQ(scifmt::render_exp_suffix(suffix, rendering::plain), "e-03");

    suffix = scifmt::make_exp_suffix(exp_mode::engineering, 3, opts);
    EXPECT_EQ(suffix.prefix, "K");

    suffix = scifmt::make_exp_suffix(exp_mode::scientific, -2, opts);
    EXPECT_EQ(suffix.prefix, "c");
}

TEST(ExponentTest, FixedPointAndPercentSuffixes) {
    const scifmt::resolved_options opts;
    EXPECT_EQ(scifmt::make_exp_suffix(exp_mode::fixed_point, 0, opts).type, exp_suffix::kind::none);
    EXPECT_EQ(scifmt::make_exp_suffix(exp_mode::percent, 0, opts).type, exp_suffix::kind::percent);
}

}  // namespace

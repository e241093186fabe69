#include "scifmt/exception.h"
#include "scifmt/number.h"

#include <gtest/gtest.h>

#include <limits>
#include <sstream>

using scifmt::decimal;
using scifmt::formatter;
using scifmt::user_options;

namespace {

class FormatterTest : public ::testing::Test {
 protected:
    void TearDown() override { scifmt::defaults_registry::instance().reset(); }
};

TEST_F(FormatterTest, SignificantFiguresEngineering) {
    user_options opts;
    opts.exp_mode = scifmt::exp_mode::engineering;
    opts.round_mode = scifmt::round_mode::sig_fig;
    opts.ndigits.emplace(4);
    EXPECT_EQ(formatter(opts)(12345.678).str(), "12.35e+03");
}

TEST_F(FormatterTest, FromFormatSpec) {
    const formatter fmt = formatter::from_format_spec("!2e");
    EXPECT_EQ(fmt.input_options().exp_mode, scifmt::exp_mode::scientific);
    EXPECT_FALSE(fmt.input_options().sign_mode);
    EXPECT_EQ(fmt(0.00062607).str(), "6.3e-04");
}

TEST_F(FormatterTest, InvalidOptionsRejectedAtConstruction) {
    user_options opts;
    opts.exp_mode = scifmt::exp_mode::engineering;
    opts.exp_val.emplace(4);
    EXPECT_THROW(formatter{opts}, scifmt::config_error);
    EXPECT_THROW(formatter::from_format_spec("rx4"), scifmt::config_error);
    EXPECT_THROW(formatter::from_format_spec("#bx15"), scifmt::config_error);
    EXPECT_THROW(formatter::from_format_spec("<>"), scifmt::parse_error);
}

TEST_F(FormatterTest, OutOfRangeExponentAndDigitsRejected) {
    EXPECT_THROW(formatter::from_format_spec("ex-2147483648"), scifmt::config_error);
    EXPECT_THROW(formatter::from_format_spec("!2147483647"), scifmt::config_error);
    EXPECT_THROW(formatter::from_format_spec(".-2147483648"), scifmt::config_error);
    EXPECT_THROW(formatter::from_format_spec("ex-99999999999"), scifmt::parse_error);
    EXPECT_EQ(formatter::from_format_spec("ex-6")(1.5).str(), "1500000e-06");
}

TEST_F(FormatterTest, ErrorHierarchy) {
    EXPECT_THROW(formatter::from_format_spec("fx1"), scifmt::format_error);
    EXPECT_THROW(formatter::from_format_spec("<>"), scifmt::format_error);
}

TEST_F(FormatterTest, UnsetOptionsComeFromGlobalDefaults) {
    const formatter fmt;
    EXPECT_EQ(fmt(123.456).str(), "123.456");
    {
        user_options opts;
        opts.exp_mode = scifmt::exp_mode::scientific;
        scifmt::scoped_defaults scope(opts);
        EXPECT_EQ(fmt.populated_options().exp_mode, scifmt::exp_mode::scientific);
        EXPECT_EQ(fmt(123.456).str(), "1.23456e+02");
    }
    EXPECT_EQ(fmt(123.456).str(), "123.456");
}

TEST_F(FormatterTest, ExplicitOptionsWinOverGlobalDefaults) {
    user_options defaults;
    defaults.exp_mode = scifmt::exp_mode::scientific;
    defaults.ndigits.emplace(2);
    scifmt::defaults_registry::instance().set(defaults);

    const formatter fmt = formatter::from_format_spec("f");
    EXPECT_EQ(fmt(123.456).str(), "120");
}

TEST_F(FormatterTest, Renderings) {
    user_options opts;
    opts.exp_mode = scifmt::exp_mode::scientific;
    const scifmt::formatted_number result = formatter(opts)(123.456);
    EXPECT_EQ(result.str(), "1.23456e+02");
    EXPECT_EQ(result.as_ascii(), "1.23456e+02");
    EXPECT_EQ(result.as_html(), "1.23456×10<sup>2</sup>");
    EXPECT_EQ(result.as_latex(), "$1.23456\\times 10^{+2}$");
    EXPECT_EQ(result.as_latex(true), "1.23456\\times 10^{+2}");
    EXPECT_EQ(result.render(scifmt::rendering::superscript), "1.23456×10²");

    opts.superscript = true;
    EXPECT_EQ(formatter(opts)(123.456).str(), "1.23456×10²");

    opts.latex = true;
    EXPECT_EQ(formatter(opts)(123.456).str(), "1.23456\\times 10^{+2}");
}

TEST_F(FormatterTest, ResultComparesAndStreamsAsText) {
    const scifmt::formatted_number result = formatter::from_format_spec("!3f")(3.14159);
    EXPECT_TRUE(result == std::string("3.14"));
    EXPECT_TRUE(result != std::string("3.142"));

    std::ostringstream os;
    os << result;
    EXPECT_EQ(os.str(), "3.14");
}

TEST_F(FormatterTest, PrefixRenderings) {
    const scifmt::formatted_number result = scifmt::number(3.1415e-6).format("ep");
    EXPECT_EQ(result.str(), "3.1415 μ");
    EXPECT_EQ(result.as_ascii(), "3.1415 u");
    EXPECT_EQ(result.as_latex(), "$3.1415\\text{ μ}$");
}

TEST_F(FormatterTest, OptionalPrefixes) {
    user_options opts;
    opts.exp_mode = scifmt::exp_mode::scientific;
    opts.exp_format = scifmt::exp_format::prefix;
    EXPECT_EQ(formatter(opts)(0.031415).str(), "3.1415e-02");

    opts.add_c_prefix = true;
    EXPECT_EQ(formatter(opts)(0.031415).str(), "3.1415 c");

    opts.add_c_prefix.reset();
    opts.add_small_si_prefixes = true;
    EXPECT_EQ(formatter(opts)(314.15).str(), "3.1415 h");
    EXPECT_EQ(formatter(opts)(31.415).str(), "3.1415 da");
    EXPECT_EQ(formatter(opts)(0.31415).str(), "3.1415 d");
}

TEST_F(FormatterTest, PartsPerForms) {
    user_options opts;
    opts.exp_mode = scifmt::exp_mode::engineering;
    opts.exp_format = scifmt::exp_format::parts_per;
    EXPECT_EQ(formatter(opts)(3.1415e-6).str(), "3.1415 ppm");
    EXPECT_EQ(formatter(opts)(3.1415e-9).str(), "3.1415 ppb");
    EXPECT_EQ(formatter(opts)(3.1415e-3).str(), "3.1415e-03");

    opts.add_ppth_form = true;
    EXPECT_EQ(formatter(opts)(3.1415e-3).str(), "3.1415 ppth");
}

TEST_F(FormatterTest, SuppressedPrefixFallsBackToStandardExponent) {
    user_options opts;
    opts.exp_mode = scifmt::exp_mode::engineering;
    opts.exp_format = scifmt::exp_format::prefix;
    EXPECT_EQ(formatter(opts)(3.1415e-3).str(), "3.1415 m");

    opts.extra_si_prefixes = scifmt::prefix_table{{-3, std::nullopt}};
    EXPECT_EQ(formatter(opts)(3.1415e-3).str(), "3.1415e-03");
}

TEST_F(FormatterTest, BinaryPrefixes) {
    user_options opts;
    opts.exp_mode = scifmt::exp_mode::binary_iec;
    opts.exp_format = scifmt::exp_format::prefix;
    EXPECT_EQ(formatter(opts)(1048576.0).str(), "1 Mi");
    EXPECT_EQ(formatter(opts)(1536.0).str(), "1.5 Ki");

    opts.exp_format = scifmt::exp_format::standard;
    EXPECT_EQ(formatter(opts)(1536.0).str(), "1.5b+10");
}

TEST_F(FormatterTest, NonFiniteWithFixedExponent) {
    user_options opts;
    opts.exp_mode = scifmt::exp_mode::scientific;
    opts.exp_val.emplace(3);
    opts.nan_inf_exp = true;
    EXPECT_EQ(formatter(opts)(std::numeric_limits<double>::quiet_NaN()).str(), "(nan)e+03");

    opts.nan_inf_exp = false;
    EXPECT_EQ(formatter(opts)(std::numeric_limits<double>::quiet_NaN()).str(), "nan");
}

TEST_F(FormatterTest, DecimalInputKeepsAllDigits) {
    EXPECT_EQ(scifmt::number(decimal::parse("1234.5678901234567890123")).format().str(), "1234.5678901234567890123");
    EXPECT_EQ(scifmt::number(decimal::parse("0.1"), decimal::parse("0.02")).format().str(), "0.10 ± 0.02");
    EXPECT_EQ(formatter::from_format_spec("!3")(decimal::parse("2.675")).str(), "2.68");
}

TEST_F(FormatterTest, HalfToEvenRounding) {
    const formatter fmt = formatter::from_format_spec(".0f");
    EXPECT_EQ(fmt(decimal::parse("2.5")).str(), "2");
    EXPECT_EQ(fmt(decimal::parse("3.5")).str(), "4");
    EXPECT_EQ(fmt(decimal::parse("-0.5")).str(), "0");
}

TEST_F(FormatterTest, ZeroMantissaResetsExponent) {
    EXPECT_EQ(formatter::from_format_spec(".-1e")(123.456).str(), "0e+00");
    EXPECT_EQ(formatter::from_format_spec("ex3")(0.0).str(), "0e+00");
}

}  // namespace

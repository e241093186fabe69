#include "scifmt/mantissa.h"

#include <gtest/gtest.h>

using scifmt::decimal;
using scifmt::sign_mode;

namespace {

decimal dec(const char* s) { return decimal::parse(s); }

TEST(MantissaTest, SignString) {
    EXPECT_EQ(scifmt::get_sign_str(dec("1"), sign_mode::negative), "");
    EXPECT_EQ(scifmt::get_sign_str(dec("1"), sign_mode::always), "+");
    EXPECT_EQ(scifmt::get_sign_str(dec("1"), sign_mode::space), " ");
    EXPECT_EQ(scifmt::get_sign_str(dec("-1"), sign_mode::negative), "-");
    EXPECT_EQ(scifmt::get_sign_str(dec("-1"), sign_mode::always), "-");
    EXPECT_EQ(scifmt::get_sign_str(dec("-1"), sign_mode::space), "-");
}

TEST(MantissaTest, SignOfZeroAndNan) {
    EXPECT_EQ(scifmt::get_sign_str(decimal(0), sign_mode::negative), "");
    EXPECT_EQ(scifmt::get_sign_str(decimal(0), sign_mode::always), " ");
    EXPECT_EQ(scifmt::get_sign_str(dec("-0"), sign_mode::always), " ");
    EXPECT_EQ(scifmt::get_sign_str(decimal::nan(), sign_mode::space), " ");
    EXPECT_EQ(scifmt::get_sign_str(decimal::nan(), sign_mode::negative), "");
    EXPECT_EQ(scifmt::get_sign_str(decimal::infinity(), sign_mode::always), "+");
    EXPECT_EQ(scifmt::get_sign_str(decimal::infinity(true), sign_mode::negative), "-");
}

TEST(MantissaTest, PadString) {
    EXPECT_EQ(scifmt::get_pad_str('0', 1, 4), "000");
    EXPECT_EQ(scifmt::get_pad_str('0', -2, 2), "00");
    EXPECT_EQ(scifmt::get_pad_str(' ', 3, 2), "");
    EXPECT_EQ(scifmt::get_pad_str(' ', 2, 2), "");
}

TEST(MantissaTest, FormatByTopAndBottomDigit) {
    EXPECT_EQ(scifmt::format_num_by_top_bottom_dig(dec("12"), 4, 0, sign_mode::negative, ' '), "   12");
    EXPECT_EQ(scifmt::format_num_by_top_bottom_dig(dec("-1.5"), 2, -2, sign_mode::negative, '0'), "-001.50");
    EXPECT_EQ(scifmt::format_num_by_top_bottom_dig(dec("1.5"), 0, -1, sign_mode::always, ' '), "+1.5");
    EXPECT_EQ(scifmt::format_num_by_top_bottom_dig(dec("0.0006"), 0, -4, sign_mode::negative, ' '), "0.0006");
    EXPECT_EQ(scifmt::format_num_by_top_bottom_dig(dec("10"), 0, 1, sign_mode::negative, ' '), "10");
}

TEST(MantissaTest, Separators) {
    using scifmt::decimal_separator;
    using scifmt::lower_separator;
    using scifmt::upper_separator;

    EXPECT_EQ(scifmt::add_separators("1234567.7654321", upper_separator::comma, decimal_separator::point,
                                     lower_separator::space),
              "1,234,567.765 432 1");
    EXPECT_EQ(scifmt::add_separators("1234567.7654321", upper_separator::point, decimal_separator::comma,
                                     lower_separator::underscore),
              "1.234.567,765_432_1");
    EXPECT_EQ(scifmt::add_separators("-00012", upper_separator::comma, decimal_separator::point,
                                     lower_separator::none),
              "-00,012");
    EXPECT_EQ(scifmt::add_separators("   12", upper_separator::comma, decimal_separator::point,
                                     lower_separator::none),
              "   12");
    EXPECT_EQ(scifmt::add_separators("123.456", upper_separator::none, decimal_separator::comma,
                                     lower_separator::none),
              "123,456");
    EXPECT_EQ(scifmt::add_separators("123", upper_separator::space, decimal_separator::point,
                                     lower_separator::space),
              "123");
    EXPECT_EQ(scifmt::add_separators("nan", upper_separator::comma, decimal_separator::point,
                                     lower_separator::space),
              "nan");
}

}  // namespace

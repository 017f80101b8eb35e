#include <gtest/gtest.h>
#include "core/Decimal.hpp"

TEST(Decimal, parse_integer) {
    EXPECT_EQ(420000, Decimal::parse("42").raw());
    EXPECT_EQ("42.0000", Decimal::parse("42").to_string());
}

TEST(Decimal, parse_fraction_and_sign) {
    EXPECT_EQ("-3.5000", Decimal::parse("-3.5").to_string());
    EXPECT_EQ("0.2500", Decimal::parse("  .25 ").to_string());
    EXPECT_EQ("7.0000", Decimal::parse("+7.").to_string());
}

TEST(Decimal, parse_truncates_extra_digits) {
    EXPECT_EQ("1.2345", Decimal::parse("1.23456").to_string());
    EXPECT_EQ("-1.2345", Decimal::parse("-1.23459").to_string());
    EXPECT_TRUE(Decimal::parse("-0.00001").is_zero());
}

TEST(Decimal, parse_rejects_garbage) {
    for (const char* bad : {"", " ", "abc", "1e5", "12x", "nan", "inf", "1.2.3", "-", ".", "0x10", "1 2"}) {
        EXPECT_THROW(Decimal::parse(bad), Decimal::ParseError) << "input: \"" << bad << "\"";
    }
}

TEST(Decimal, parse_rejects_out_of_range) {
    EXPECT_THROW(Decimal::parse("99999999999999999999"), Decimal::ParseError);
    EXPECT_THROW(Decimal::parse("922337203685477.9999"), Decimal::ParseError);
    EXPECT_THROW(Decimal::parse("-922337203685477.9999"), Decimal::ParseError);
    EXPECT_EQ("922337203685477.5807", Decimal::parse("922337203685477.5807").to_string());
}

TEST(Decimal, division_truncates_to_4_digits) {
    EXPECT_EQ("22.2222", (Decimal(2000) / Decimal(90)).to_string());
    EXPECT_EQ("0.3333", (Decimal(1) / Decimal(3)).to_string());
    EXPECT_EQ("-0.3333", (Decimal(-1) / Decimal(3)).to_string());
    EXPECT_EQ("-3.5000", (Decimal(-7) / Decimal(2)).to_string());
}

TEST(Decimal, division_by_zero_throws) {
    EXPECT_THROW(Decimal(1) / Decimal(0), std::domain_error);
}

TEST(Decimal, multiplication) {
    EXPECT_EQ("2.2500", (Decimal::parse("1.5") * Decimal::parse("1.5")).to_string());
    EXPECT_TRUE((Decimal::parse("0.0001") * Decimal::parse("0.5")).is_zero());
    EXPECT_EQ("-200.0000", (Decimal(-2) * Decimal(100)).to_string());
}

TEST(Decimal, addition_is_exact) {
    EXPECT_EQ(Decimal::parse("0.3"), Decimal::parse("0.1") + Decimal::parse("0.2"));
    EXPECT_EQ(Decimal(-5), Decimal(5) - Decimal(10));
}

TEST(Decimal, abs_sign_trunc) {
    EXPECT_EQ(Decimal(5), Decimal(-5).abs());
    EXPECT_EQ(-1, Decimal(-5).sign());
    EXPECT_EQ(0, Decimal().sign());
    EXPECT_EQ(16, Decimal::parse("16.9999").trunc());
    EXPECT_EQ(-16, Decimal::parse("-16.9999").trunc());
}

TEST(Decimal, short_string) {
    EXPECT_EQ("48", Decimal(48).to_short_string());
    EXPECT_EQ("12.5", Decimal::parse("12.50").to_short_string());
    EXPECT_EQ("-0.25", Decimal::parse("-0.25").to_short_string());
    EXPECT_EQ("0", Decimal().to_short_string());
}

TEST(Decimal, fmt_formatter) {
    EXPECT_EQ("rate 10.0000", fmt::format("rate {}", Decimal(10)));
}

TEST(Decimal, mul_div_keeps_wide_product) {
    const Decimal delta = Decimal::parse("10000000000000");
    const Decimal total = Decimal::parse("20000000000000");
    EXPECT_THROW(delta * Decimal(100), std::overflow_error);
    EXPECT_EQ("50.0000", Decimal::mul_div(delta, Decimal(100), total).to_string());
    EXPECT_EQ("22.2222", Decimal::mul_div(Decimal(20), Decimal(100), Decimal(90)).to_string());
    EXPECT_THROW(Decimal::mul_div(Decimal(1), Decimal(1), Decimal(0)), std::domain_error);
}

TEST(Decimal, div_trunc) {
    EXPECT_EQ(7, Decimal(70).div_trunc(Decimal(10)));
    EXPECT_EQ(22, Decimal(2000).div_trunc(Decimal(90)));
    EXPECT_EQ(-3, Decimal(-7).div_trunc(Decimal(2)));
    EXPECT_EQ(90000000000000000, Decimal::parse("9000000000000").div_trunc(Decimal::parse("0.0001")));
    EXPECT_THROW(Decimal(1).div_trunc(Decimal(0)), std::domain_error);
}

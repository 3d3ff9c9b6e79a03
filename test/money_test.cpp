#include <gtest/gtest.h>
#include "../src/util/money.hpp"

namespace
{
    TEST(money, parse_amount_accepts_two_fraction_digits)
    {
        int64_t cents = 0;
        EXPECT_EQ(0, money::parse_amount("99.99", cents));
        EXPECT_EQ(9999, cents);
        EXPECT_EQ(0, money::parse_amount("5", cents));
        EXPECT_EQ(500, cents);
        EXPECT_EQ(0, money::parse_amount("0.5", cents));
        EXPECT_EQ(50, cents);
        EXPECT_EQ(0, money::parse_amount("-1.25", cents));
        EXPECT_EQ(-125, cents);
        EXPECT_EQ(0, money::parse_amount("10000000000", cents));
        EXPECT_EQ(money::MAX_AMOUNT_CENTS, cents);
    }

    TEST(money, parse_amount_rejects_malformed)
    {
        int64_t cents = 42;
        EXPECT_EQ(-1, money::parse_amount("", cents));
        EXPECT_EQ(-1, money::parse_amount("1.234", cents));
        EXPECT_EQ(-1, money::parse_amount("1.", cents));
        EXPECT_EQ(-1, money::parse_amount(".5", cents));
        EXPECT_EQ(-1, money::parse_amount("12a", cents));
        EXPECT_EQ(-1, money::parse_amount("1e3", cents));
        EXPECT_EQ(-1, money::parse_amount("10000000000.01", cents));
        EXPECT_EQ(-1, money::parse_amount("99999999999", cents));
        EXPECT_EQ(42, cents);
    }

    TEST(money, parse_rate)
    {
        int64_t ppm = 0;
        EXPECT_EQ(0, money::parse_rate("0.20", ppm));
        EXPECT_EQ(200000, ppm);
        EXPECT_EQ(0, money::parse_rate("1", ppm));
        EXPECT_EQ(1000000, ppm);
        EXPECT_EQ(0, money::parse_rate("0.125", ppm));
        EXPECT_EQ(125000, ppm);
        EXPECT_EQ(-1, money::parse_rate("1.5", ppm));
        EXPECT_EQ(-1, money::parse_rate("-0.1", ppm));
        EXPECT_EQ(-1, money::parse_rate("0.1234567", ppm));
    }

    TEST(money, rounds_half_to_even)
    {
        EXPECT_EQ(2, money::div_round_half_even(5, 2));
        EXPECT_EQ(4, money::div_round_half_even(7, 2));
        EXPECT_EQ(-2, money::div_round_half_even(-5, 2));
        EXPECT_EQ(-4, money::div_round_half_even(-7, 2));
        EXPECT_EQ(3, money::div_round_half_even(11, 4));
        EXPECT_EQ(2, money::div_round_half_even(10, 4));

        // 0.5 cent rounds down to even, 1.5 cents rounds up to even.
        EXPECT_EQ(0, money::apply_rate(2, 250000));
        EXPECT_EQ(2, money::apply_rate(6, 250000));
        EXPECT_EQ(600, money::apply_rate(2999, 200000));
    }

    TEST(money, large_products_do_not_overflow)
    {
        EXPECT_EQ(money::MAX_AMOUNT_CENTS, money::mul_div_round_half_even(money::MAX_AMOUNT_CENTS, money::PPM_SCALE, money::PPM_SCALE));
        EXPECT_EQ(200000000000, money::apply_rate(money::MAX_AMOUNT_CENTS, 200000));
    }

    TEST(money, percent_hundredths)
    {
        EXPECT_EQ(4284, money::percent_hundredths(2999, 7000));
        EXPECT_EQ(10000, money::percent_hundredths(5, 5));
        EXPECT_EQ(0, money::percent_hundredths(1, 0));
    }

    TEST(money, formatting)
    {
        EXPECT_EQ("99.99", money::to_string(9999));
        EXPECT_EQ("0.05", money::to_string(5));
        EXPECT_EQ("0.00", money::to_string(0));
        EXPECT_EQ("-12.34", money::to_string(-1234));
        EXPECT_EQ("-0.01", money::to_string(-1));
        EXPECT_EQ("0.20", money::rate_to_string(200000));
        EXPECT_EQ("0.125", money::rate_to_string(125000));
        EXPECT_EQ("1.00", money::rate_to_string(1000000));
    }

} // namespace

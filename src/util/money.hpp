#ifndef _UL_UTIL_MONEY_
#define _UL_UTIL_MONEY_

#include "../pchheader.hpp"

/**
 * Fixed-point currency helpers. Amounts are signed 64 bit integer cents, rates are integer
 * parts-per-million and percentages are integer hundredths of a percent. No binary floating
 * point is used anywhere in fee arithmetic.
 */
namespace money
{
    constexpr int64_t CENTS_PER_UNIT = 100;
    constexpr int64_t PPM_SCALE = 1000000;

    // Largest accepted absolute amount for a single value (10 billion currency units).
    constexpr int64_t MAX_AMOUNT_CENTS = 1000000000000;

    int parse_amount(std::string_view str, int64_t &cents);

    int parse_rate(std::string_view str, int64_t &ppm);

    int64_t div_round_half_even(const int64_t num, const int64_t den);

    int64_t mul_div_round_half_even(const int64_t a, const int64_t b, const int64_t den);

    int64_t apply_rate(const int64_t cents, const int64_t ppm);

    int64_t percent_hundredths(const int64_t part, const int64_t whole);

    const std::string to_string(const int64_t cents);

    const std::string rate_to_string(const int64_t ppm);

} // namespace money

#endif

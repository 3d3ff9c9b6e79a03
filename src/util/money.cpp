#include "money.hpp"

namespace money
{
    /**
     * Parses a decimal currency string such as "99.99", "-5" or "0.5" into cents.
     * At most two fraction digits are accepted.
     * @return 0 on success. -1 if the string is not a valid amount or is out of range.
     */
    int parse_amount(std::string_view str, int64_t &cents)
    {
        if (str.empty())
            return -1;

        bool negative = false;
        size_t pos = 0;
        if (str[0] == '-' || str[0] == '+')
        {
            negative = str[0] == '-';
            pos = 1;
        }

        int64_t units = 0;
        size_t int_digits = 0;
        while (pos < str.size() && str[pos] >= '0' && str[pos] <= '9')
        {
            units = units * 10 + (str[pos] - '0');
            if (units > MAX_AMOUNT_CENTS / CENTS_PER_UNIT)
                return -1;
            int_digits++;
            pos++;
        }

        int64_t fraction = 0;
        size_t frac_digits = 0;
        if (pos < str.size() && str[pos] == '.')
        {
            pos++;
            while (pos < str.size() && str[pos] >= '0' && str[pos] <= '9')
            {
                if (++frac_digits > 2)
                    return -1;
                fraction = fraction * 10 + (str[pos] - '0');
                pos++;
            }

            // A trailing dot without digits is not a valid amount.
            if (frac_digits == 0)
                return -1;
        }

        if (pos != str.size() || int_digits == 0)
            return -1;

        if (frac_digits == 1)
            fraction *= 10;

        const int64_t value = units * CENTS_PER_UNIT + fraction;
        if (value > MAX_AMOUNT_CENTS)
            return -1;

        cents = negative ? -value : value;
        return 0;
    }

    /**
     * Parses a decimal rate between 0 and 1 (eg. "0.20") into parts-per-million.
     * @return 0 on success. -1 on malformed or out of range rate.
     */
    int parse_rate(std::string_view str, int64_t &ppm)
    {
        if (str.empty())
            return -1;

        size_t pos = 0;
        int64_t whole = 0;
        size_t int_digits = 0;
        while (pos < str.size() && str[pos] >= '0' && str[pos] <= '9')
        {
            whole = whole * 10 + (str[pos] - '0');
            if (whole > 1)
                return -1;
            int_digits++;
            pos++;
        }

        int64_t fraction = 0;
        size_t frac_digits = 0;
        if (pos < str.size() && str[pos] == '.')
        {
            pos++;
            while (pos < str.size() && str[pos] >= '0' && str[pos] <= '9')
            {
                if (++frac_digits > 6)
                    return -1;
                fraction = fraction * 10 + (str[pos] - '0');
                pos++;
            }

            if (frac_digits == 0)
                return -1;
        }

        if (pos != str.size() || int_digits == 0)
            return -1;

        for (size_t i = frac_digits; i < 6; i++)
            fraction *= 10;

        const int64_t value = whole * PPM_SCALE + fraction;
        if (value > PPM_SCALE)
            return -1;

        ppm = value;
        return 0;
    }

    /**
     * Divides with round-half-even ("banker's rounding") of the exact quotient.
     * @param den Divisor. Must be positive.
     */
    int64_t div_round_half_even(const int64_t num, const int64_t den)
    {
        return mul_div_round_half_even(num, 1, den);
    }

    /**
     * Computes round_half_even(a * b / den) using a 128 bit intermediate so the product never
     * overflows. The result saturates at the int64 limits.
     * @param den Divisor. Must be positive.
     */
    int64_t mul_div_round_half_even(const int64_t a, const int64_t b, const int64_t den)
    {
        if (den <= 0)
            return 0;

        const __int128 num = static_cast<__int128>(a) * b;
        __int128 q = num / den;
        const __int128 r = num % den; // Has the sign of num.
        const __int128 twice_abs_r = (r < 0 ? -r : r) * 2;

        if (twice_abs_r > den || (twice_abs_r == den && (q % 2 != 0)))
            q += (num < 0) ? -1 : 1;

        if (q > std::numeric_limits<int64_t>::max())
            return std::numeric_limits<int64_t>::max();
        if (q < std::numeric_limits<int64_t>::min())
            return std::numeric_limits<int64_t>::min();
        return static_cast<int64_t>(q);
    }

    /**
     * Applies a parts-per-million rate to an amount, rounding half-even to the cent.
     */
    int64_t apply_rate(const int64_t cents, const int64_t ppm)
    {
        return mul_div_round_half_even(cents, ppm, PPM_SCALE);
    }

    /**
     * Returns part/whole*100 in hundredths of a percent (4284 == 42.84%). 0 when whole is not positive.
     */
    int64_t percent_hundredths(const int64_t part, const int64_t whole)
    {
        if (whole <= 0)
            return 0;
        return mul_div_round_half_even(part, 10000, whole);
    }

    /**
     * Formats a two-digit fixed-point value as a decimal string (-1234 -> "-12.34").
     * Used for cents as well as hundredths of a percent.
     */
    const std::string to_string(const int64_t cents)
    {
        // Work in unsigned space so the most negative value does not overflow on negation.
        const bool negative = cents < 0;
        const uint64_t abs_value = negative ? (0 - static_cast<uint64_t>(cents)) : static_cast<uint64_t>(cents);

        std::string s = std::to_string(abs_value / CENTS_PER_UNIT);
        const uint64_t fraction = abs_value % CENTS_PER_UNIT;
        s.append(".");
        s.push_back('0' + fraction / 10);
        s.push_back('0' + fraction % 10);

        return negative ? "-" + s : s;
    }

    /**
     * Formats a parts-per-million rate with at least two fraction digits (200000 -> "0.20").
     */
    const std::string rate_to_string(const int64_t ppm)
    {
        std::string fraction = std::to_string(ppm % PPM_SCALE);
        fraction.insert(0, 6 - fraction.size(), '0');
        while (fraction.size() > 2 && fraction.back() == '0')
            fraction.pop_back();

        return std::to_string(ppm / PPM_SCALE) + "." + fraction;
    }

} // namespace money

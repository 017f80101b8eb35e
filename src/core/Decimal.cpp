/**
 * @file Decimal.cpp
 * @brief Implementation of the 4-digit fixed-point number used by the progress math.
 *
 * All estimator arithmetic is done on scaled 64-bit integers with 128-bit
 * intermediates, so results are exact and reproducible: 2000 / 90 is always
 * 22.2222, never 22.222199999.
 */

#include "Decimal.hpp"

#include <cctype>

/**
 * @brief Narrows a 128-bit intermediate back to the 64-bit representation.
 * @throws std::overflow_error If the value does not fit.
 */
int64_t Decimal::checked(__int128_t value) {
    if( value > std::numeric_limits<int64_t>::max() || value < -std::numeric_limits<int64_t>::max() ){
        throw std::overflow_error("decimal overflow");
    }
    return static_cast<int64_t>(value);
}

/**
 * @brief Parses a plain decimal number.
 *
 * Accepts an optional sign, integer digits, an optional '.' followed by fraction
 * digits, and surrounding whitespace. At least one digit is required. Exponents,
 * hex, "inf" and "nan" are rejected.
 *
 * @param text Input text, e.g. "42", "-3.5", "  .25 ".
 * @return Parsed value, truncated to 4 fractional digits.
 * @throws ParseError If the text is not a number or is out of range.
 */
Decimal Decimal::parse(const std::string& text) {
    size_t i = 0, end = text.size();
    while( i < end && isspace((unsigned char)text[i]) ) i++;
    while( end > i && isspace((unsigned char)text[end-1]) ) end--;

    bool negative = false;
    if( i < end && (text[i] == '-' || text[i] == '+') ){
        negative = text[i] == '-';
        i++;
    }

    __int128_t integer = 0, fraction = 0;
    int nfrac = 0;
    size_t ndigits = 0;
    bool seen_dot = false;

    for( ; i < end; i++ ){
        const char c = text[i];
        if( c == '.' && !seen_dot ){
            seen_dot = true;
            continue;
        }
        if( !isdigit((unsigned char)c) ){
            throw ParseError("not a number: \"" + text + "\"");
        }
        ndigits++;
        if( seen_dot ){
            if( nfrac < SCALE_DIGITS ){
                fraction = fraction * 10 + (c - '0');
                nfrac++;
            }
        } else {
            integer = integer * 10 + (c - '0');
            if( integer > MAX_INTEGER ){
                throw ParseError("number out of range: \"" + text + "\"");
            }
        }
    }

    if( ndigits == 0 ){
        throw ParseError("not a number: \"" + text + "\"");
    }

    for( ; nfrac < SCALE_DIGITS; nfrac++ ){
        fraction *= 10;
    }

    const __int128_t raw = integer * SCALE + fraction;
    if( raw > std::numeric_limits<int64_t>::max() ){
        throw ParseError("number out of range: \"" + text + "\"");
    }
    return from_raw(static_cast<int64_t>(negative ? -raw : raw));
}

std::string Decimal::to_string() const {
    const uint64_t mag = m_raw < 0 ? -static_cast<uint64_t>(m_raw) : static_cast<uint64_t>(m_raw);
    return fmt::format("{}{}.{:04d}", m_raw < 0 ? "-" : "", mag / SCALE, mag % SCALE);
}

std::string Decimal::to_short_string() const {
    std::string s = to_string();
    while( s.back() == '0' ) s.pop_back();
    if( s.back() == '.' ) s.pop_back();
    return s;
}

Decimal Decimal::operator*(const Decimal& other) const {
    return from_raw(checked(static_cast<__int128_t>(m_raw) * other.m_raw / SCALE));
}

/**
 * @brief Truncating division, the result keeps 4 fractional digits.
 * @throws std::domain_error On division by zero.
 */
Decimal Decimal::operator/(const Decimal& other) const {
    if( other.m_raw == 0 ){
        throw std::domain_error("division by zero");
    }
    return from_raw(checked(static_cast<__int128_t>(m_raw) * SCALE / other.m_raw));
}

/**
 * @brief Computes a * b / c, truncated toward zero at 4 digits.
 *
 * Same result as (a * b) / c whenever the product is exact at 4 digits (e.g. when
 * b is an integer), but the intermediate product is never narrowed, so
 * percentages of multi-terabyte byte counts don't overflow.
 *
 * @throws std::domain_error If c is zero.
 * @throws std::overflow_error If the result does not fit.
 */
Decimal Decimal::mul_div(const Decimal& a, const Decimal& b, const Decimal& c) {
    if( c.m_raw == 0 ){
        throw std::domain_error("division by zero");
    }
    return from_raw(checked(static_cast<__int128_t>(a.m_raw) * b.m_raw / c.m_raw));
}

/**
 * @brief Integer part of the quotient, same as (*this / other).trunc().
 *
 * The 4-digit quotient is skipped, so a tiny divisor can't overflow it.
 *
 * @throws std::domain_error On division by zero.
 */
int64_t Decimal::div_trunc(const Decimal& other) const {
    if( other.m_raw == 0 ){
        throw std::domain_error("division by zero");
    }
    return checked(static_cast<__int128_t>(m_raw) / other.m_raw);
}

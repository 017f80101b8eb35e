#pragma once
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

// fixed-point number with 4 fractional digits
//  - parsing never rounds, extra fraction digits are dropped
//  - division and multiplication truncate toward zero, same as bc(1) with scale=4
class Decimal {
    public:
    static constexpr int SCALE_DIGITS = 4;
    static constexpr int64_t SCALE = 10000;
    // largest integer part that still fits
    static constexpr int64_t MAX_INTEGER = std::numeric_limits<int64_t>::max() / SCALE;

    class ParseError : public std::runtime_error {
        public:
        explicit ParseError(const std::string& msg) : std::runtime_error(msg) {}
    };

    Decimal() = default;
    Decimal(int64_t integer) : m_raw(checked(static_cast<__int128_t>(integer) * SCALE)) {}

    // either succeeds or throws ParseError
    static Decimal parse(const std::string& text);
    static Decimal from_raw(int64_t raw) { Decimal d; d.m_raw = raw; return d; }

    int64_t raw() const { return m_raw; }
    int64_t trunc() const { return m_raw / SCALE; }
    Decimal abs() const { return from_raw(m_raw < 0 ? -m_raw : m_raw); }
    bool is_zero() const { return m_raw == 0; }
    int sign() const { return (m_raw > 0) - (m_raw < 0); }

    // "22.2222", "-0.5000", "100.0000"
    std::string to_string() const;
    // trailing fraction zeros dropped: "48", "12.5"
    std::string to_short_string() const;

    Decimal operator+(const Decimal& other) const { return from_raw(checked(static_cast<__int128_t>(m_raw) + other.m_raw)); }
    Decimal operator-(const Decimal& other) const { return from_raw(checked(static_cast<__int128_t>(m_raw) - other.m_raw)); }
    Decimal operator-() const { return from_raw(-m_raw); }
    Decimal operator*(const Decimal& other) const;
    Decimal operator/(const Decimal& other) const;

    // a * b / c with a single truncation, the product never has to fit 64 bits
    static Decimal mul_div(const Decimal& a, const Decimal& b, const Decimal& c);
    // integer part of *this / other, exact for any pair of decimals
    int64_t div_trunc(const Decimal& other) const;

    bool operator==(const Decimal& other) const { return m_raw == other.m_raw; }
    bool operator!=(const Decimal& other) const { return m_raw != other.m_raw; }
    bool operator<(const Decimal& other) const  { return m_raw < other.m_raw; }
    bool operator<=(const Decimal& other) const { return m_raw <= other.m_raw; }
    bool operator>(const Decimal& other) const  { return m_raw > other.m_raw; }
    bool operator>=(const Decimal& other) const { return m_raw >= other.m_raw; }

    private:
    static int64_t checked(__int128_t value);

    int64_t m_raw = 0;
};

// spdlog/fmt integration, prints the same as to_string()
#include <spdlog/fmt/fmt.h>

template <>
struct fmt::formatter<Decimal> : fmt::formatter<std::string> {
    template <typename FormatContext>
    auto format(const Decimal& d, FormatContext& ctx) const {
        return fmt::formatter<std::string>::format(d.to_string(), ctx);
    }
};

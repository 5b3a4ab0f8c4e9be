#pragma once

#include <cstdint>
#include <ostream>
#include <string>

namespace acb {

// Signed fixed-point decimal with 18 fraction digits on a 128-bit mantissa.
// Sums and differences are exact; products and quotients round half away
// from zero at the 18th digit. Overflow throws std::overflow_error.
class Decimal {
public:
    static constexpr int kScale = 18;

    Decimal() = default;

    static Decimal from_string(const std::string& text);
    static Decimal from_integer(long long value);

    Decimal operator-() const;
    Decimal& operator+=(const Decimal& rhs);
    Decimal& operator-=(const Decimal& rhs);
    Decimal& operator*=(const Decimal& rhs);
    Decimal& operator/=(const Decimal& rhs);

    friend Decimal operator+(Decimal lhs, const Decimal& rhs) { return lhs += rhs; }
    friend Decimal operator-(Decimal lhs, const Decimal& rhs) { return lhs -= rhs; }
    friend Decimal operator*(Decimal lhs, const Decimal& rhs) { return lhs *= rhs; }
    friend Decimal operator/(Decimal lhs, const Decimal& rhs) { return lhs /= rhs; }

    friend bool operator==(const Decimal& a, const Decimal& b) { return a.raw_ == b.raw_; }
    friend bool operator!=(const Decimal& a, const Decimal& b) { return a.raw_ != b.raw_; }
    friend bool operator<(const Decimal& a, const Decimal& b) { return a.raw_ < b.raw_; }
    friend bool operator<=(const Decimal& a, const Decimal& b) { return a.raw_ <= b.raw_; }
    friend bool operator>(const Decimal& a, const Decimal& b) { return a.raw_ > b.raw_; }
    friend bool operator>=(const Decimal& a, const Decimal& b) { return a.raw_ >= b.raw_; }

    [[nodiscard]] bool is_zero() const { return raw_ == 0; }
    [[nodiscard]] bool is_negative() const { return raw_ < 0; }
    [[nodiscard]] bool is_positive() const { return raw_ > 0; }
    [[nodiscard]] Decimal abs() const;

    // Rounds to `places` fraction digits (0..18), half away from zero.
    [[nodiscard]] Decimal round(int places) const;

    // Shortest exact representation, e.g. "0.0005", "-12", "1.5".
    std::string to_string() const;

    // Rounded and zero padded to exactly `places` fraction digits.
    std::string to_fixed(int places) const;

private:
    using Raw = __int128;

    explicit Decimal(Raw raw) : raw_(raw) {}

    Raw raw_ = 0;
};

std::ostream& operator<<(std::ostream& os, const Decimal& value);

} // namespace acb

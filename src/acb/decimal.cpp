#include "acb/decimal.hpp"

#include "kraken/util.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace acb {
namespace {

using Raw = __int128;
using URaw = unsigned __int128;

constexpr URaw pow10_u(int exponent) {
    URaw value = 1;
    for (int i = 0; i < exponent; ++i) {
        value *= 10;
    }
    return value;
}

constexpr URaw kOne = pow10_u(Decimal::kScale);
constexpr URaw kRawMax = static_cast<URaw>(~URaw{0} >> 1);

URaw magnitude(Raw value) {
    return value < 0 ? URaw{0} - static_cast<URaw>(value) : static_cast<URaw>(value);
}

Raw apply_sign(URaw magnitude, bool negative) {
    if (magnitude > kRawMax) {
        throw std::overflow_error("Decimal overflow");
    }
    const auto value = static_cast<Raw>(magnitude);
    return negative ? -value : value;
}

URaw checked_mul(URaw a, URaw b) {
    URaw result = 0;
    if (__builtin_mul_overflow(a, b, &result)) {
        throw std::overflow_error("Decimal overflow");
    }
    return result;
}

URaw checked_add(URaw a, URaw b) {
    URaw result = 0;
    if (__builtin_add_overflow(a, b, &result)) {
        throw std::overflow_error("Decimal overflow");
    }
    return result;
}

std::string digits_of(URaw value) {
    if (value == 0) {
        return "0";
    }
    std::string digits;
    while (value != 0) {
        digits.insert(digits.begin(), static_cast<char>('0' + static_cast<int>(value % 10)));
        value /= 10;
    }
    return digits;
}

} // namespace

Decimal Decimal::from_string(const std::string& raw_text) {
    const std::string text = kraken::trim(raw_text);
    std::size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
        negative = text[pos] == '-';
        ++pos;
    }

    URaw integer = 0;
    URaw fraction = 0;
    int fraction_digits = 0;
    bool round_up = false;
    bool any_digit = false;

    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        integer = checked_add(checked_mul(integer, 10), static_cast<URaw>(text[pos] - '0'));
        any_digit = true;
        ++pos;
    }
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            const int digit = text[pos] - '0';
            if (fraction_digits < kScale) {
                fraction = fraction * 10 + static_cast<URaw>(digit);
                ++fraction_digits;
            } else if (fraction_digits == kScale) {
                round_up = digit >= 5;
                ++fraction_digits;
            }
            any_digit = true;
            ++pos;
        }
    }
    if (!any_digit || pos != text.size()) {
        throw std::invalid_argument("Invalid decimal value: '" + raw_text + "'");
    }

    for (int i = std::min(fraction_digits, kScale); i < kScale; ++i) {
        fraction *= 10;
    }
    URaw mag = checked_add(checked_mul(integer, kOne), fraction);
    if (round_up) {
        mag = checked_add(mag, 1);
    }
    return Decimal(apply_sign(mag, negative));
}

Decimal Decimal::from_integer(long long value) {
    const bool negative = value < 0;
    const URaw mag = negative ? URaw{0} - static_cast<URaw>(static_cast<Raw>(value))
                              : static_cast<URaw>(value);
    return Decimal(apply_sign(checked_mul(mag, kOne), negative));
}

Decimal Decimal::operator-() const {
    return Decimal(-raw_);
}

Decimal& Decimal::operator+=(const Decimal& rhs) {
    Raw result = 0;
    if (__builtin_add_overflow(raw_, rhs.raw_, &result)) {
        throw std::overflow_error("Decimal overflow");
    }
    raw_ = result;
    return *this;
}

Decimal& Decimal::operator-=(const Decimal& rhs) {
    Raw result = 0;
    if (__builtin_sub_overflow(raw_, rhs.raw_, &result)) {
        throw std::overflow_error("Decimal overflow");
    }
    raw_ = result;
    return *this;
}

Decimal& Decimal::operator*=(const Decimal& rhs) {
    const bool negative = (raw_ < 0) != (rhs.raw_ < 0);
    const URaw a = magnitude(raw_);
    const URaw b = magnitude(rhs.raw_);

    // (ai*S + af) * (bi*S + bf) / S, split so no partial product leaves 128 bits.
    const URaw ai = a / kOne;
    const URaw af = a % kOne;
    const URaw bi = b / kOne;
    const URaw bf = b % kOne;

    URaw result = checked_mul(checked_mul(ai, bi), kOne);
    result = checked_add(result, checked_mul(ai, bf));
    result = checked_add(result, checked_mul(af, bi));
    const URaw low = af * bf;
    URaw low_scaled = low / kOne;
    if ((low % kOne) * 2 >= kOne) {
        ++low_scaled;
    }
    result = checked_add(result, low_scaled);

    raw_ = apply_sign(result, negative);
    return *this;
}

Decimal& Decimal::operator/=(const Decimal& rhs) {
    if (rhs.raw_ == 0) {
        throw std::domain_error("Decimal division by zero");
    }
    const bool negative = (raw_ < 0) != (rhs.raw_ < 0);
    const URaw a = magnitude(raw_);
    const URaw b = magnitude(rhs.raw_);

    URaw result = checked_mul(a / b, kOne);
    URaw remainder = a % b;
    URaw fraction = 0;
    for (int i = 0; i < kScale; ++i) {
        remainder = checked_mul(remainder, 10);
        fraction = fraction * 10 + remainder / b;
        remainder %= b;
    }
    result = checked_add(result, fraction);
    if (checked_mul(remainder, 2) >= b) {
        result = checked_add(result, 1);
    }

    raw_ = apply_sign(result, negative);
    return *this;
}

Decimal Decimal::abs() const {
    return raw_ < 0 ? Decimal(-raw_) : *this;
}

Decimal Decimal::round(int places) const {
    if (places < 0 || places > kScale) {
        throw std::invalid_argument("Decimal rounding places out of range");
    }
    const URaw unit = pow10_u(kScale - places);
    const URaw mag = magnitude(raw_);
    URaw units = mag / unit;
    if ((mag % unit) * 2 >= unit) {
        ++units;
    }
    return Decimal(apply_sign(checked_mul(units, unit), raw_ < 0));
}

std::string Decimal::to_string() const {
    const URaw mag = magnitude(raw_);
    std::string text = digits_of(mag / kOne);
    std::string fraction = digits_of(mag % kOne);
    fraction.insert(fraction.begin(), static_cast<std::size_t>(kScale) - fraction.size(), '0');
    fraction.erase(fraction.find_last_not_of('0') + 1);
    if (!fraction.empty()) {
        text += '.' + fraction;
    }
    if (raw_ < 0) {
        text.insert(text.begin(), '-');
    }
    return text;
}

std::string Decimal::to_fixed(int places) const {
    const Decimal rounded = round(places);
    const URaw mag = magnitude(rounded.raw_);
    std::string text = digits_of(mag / kOne);
    if (places > 0) {
        std::string fraction = digits_of(mag % kOne);
        fraction.insert(fraction.begin(), static_cast<std::size_t>(kScale) - fraction.size(), '0');
        text += '.' + fraction.substr(0, static_cast<std::size_t>(places));
    }
    if (rounded.raw_ < 0) {
        text.insert(text.begin(), '-');
    }
    return text;
}

std::ostream& operator<<(std::ostream& os, const Decimal& value) {
    return os << value.to_string();
}

} // namespace acb

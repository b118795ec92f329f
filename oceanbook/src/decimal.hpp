#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace oceanbook {

// Exact decimal number: value = mantissa × 10^-scale.
// Kept normalized (no trailing zeros in the mantissa while scale > 0), so two equal
// values always have identical representations.
// The 128-bit mantissa holds the product of two 18-digit operands (e.g. an 8-decimal
// price times an 8-decimal quantity) without loss.
// Arithmetic never rounds. Results that do not fit throw std::overflow_error.
class Decimal {
public:
    using Mantissa = __int128;

    static constexpr int MaxScale = 36;

    Decimal() = default;
    Decimal(int64_t mantissa, int scale = 0);

    // Parse "[+-]digits[.digits]"; throws std::invalid_argument on malformed input
    static Decimal parse(std::string_view text);

    [[nodiscard]] Mantissa mantissa() const { return m_mantissa; }
    [[nodiscard]] int scale() const { return m_scale; }

    [[nodiscard]] bool isZero() const { return m_mantissa == 0; }
    [[nodiscard]] bool isNegative() const { return m_mantissa < 0; }
    [[nodiscard]] bool isPositive() const { return m_mantissa > 0; }

    // True when this value is an integral multiple of step (step must be positive)
    [[nodiscard]] bool isMultipleOf(const Decimal& step) const;

    [[nodiscard]] std::string toString() const;

    // -1, 0 or 1
    [[nodiscard]] static int compare(const Decimal& a, const Decimal& b);

    Decimal& operator+=(const Decimal& other);
    Decimal& operator-=(const Decimal& other);

    friend Decimal operator+(Decimal a, const Decimal& b) { return a += b; }
    friend Decimal operator-(Decimal a, const Decimal& b) { return a -= b; }
    friend Decimal operator*(const Decimal& a, const Decimal& b);

    friend bool operator==(const Decimal& a, const Decimal& b) { return compare(a, b) == 0; }
    friend bool operator!=(const Decimal& a, const Decimal& b) { return compare(a, b) != 0; }
    friend bool operator<(const Decimal& a, const Decimal& b) { return compare(a, b) < 0; }
    friend bool operator<=(const Decimal& a, const Decimal& b) { return compare(a, b) <= 0; }
    friend bool operator>(const Decimal& a, const Decimal& b) { return compare(a, b) > 0; }
    friend bool operator>=(const Decimal& a, const Decimal& b) { return compare(a, b) >= 0; }

private:
    void normalize();

    Mantissa m_mantissa = 0;
    int m_scale = 0;
};

std::ostream& operator<<(std::ostream& out, const Decimal& value);

} // namespace oceanbook

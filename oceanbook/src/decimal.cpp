#include "decimal.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>

namespace oceanbook {

namespace {

using Mantissa = Decimal::Mantissa;

constexpr std::array<Mantissa, Decimal::MaxScale + 1> makePowersOfTen()
{
    std::array<Mantissa, Decimal::MaxScale + 1> powers{};
    Mantissa value = 1;
    for (auto& power : powers) {
        power = value;
        value *= 10;
    }
    return powers;
}

constexpr auto kPowersOfTen = makePowersOfTen();

Mantissa checkedMultiply(Mantissa a, Mantissa b)
{
    Mantissa result = 0;
    if (__builtin_mul_overflow(a, b, &result)) {
        throw std::overflow_error("Decimal overflow in multiplication");
    }
    return result;
}

// Mantissa of value expressed at a larger scale
Mantissa rescale(Mantissa mantissa, int fromScale, int toScale)
{
    return checkedMultiply(mantissa, kPowersOfTen[toScale - fromScale]);
}

} // namespace

Decimal::Decimal(int64_t mantissa, int scale) : m_mantissa(mantissa), m_scale(scale)
{
    if (scale < 0 || scale > MaxScale) {
        throw std::invalid_argument("Decimal scale out of range: " + std::to_string(scale));
    }
    normalize();
}

Decimal Decimal::parse(std::string_view text)
{
    if (text.empty()) {
        throw std::invalid_argument("Empty decimal");
    }

    size_t pos = 0;
    bool negative = false;
    if (text[0] == '-' || text[0] == '+') {
        negative = text[0] == '-';
        ++pos;
    }

    Mantissa mantissa = 0;
    int scale = 0;
    int digits = 0;
    bool seenDot = false;

    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (c == '.') {
            if (seenDot) {
                throw std::invalid_argument("Malformed decimal: " + std::string(text));
            }
            seenDot = true;
            continue;
        }
        if (c < '0' || c > '9') {
            throw std::invalid_argument("Malformed decimal: " + std::string(text));
        }
        if (seenDot) {
            if (++scale > MaxScale) {
                throw std::invalid_argument("Too many fractional digits: " + std::string(text));
            }
        }
        Mantissa digit = c - '0';
        if (__builtin_mul_overflow(mantissa, Mantissa{10}, &mantissa) ||
            __builtin_add_overflow(mantissa, negative ? -digit : digit, &mantissa)) {
            throw std::invalid_argument("Decimal out of range: " + std::string(text));
        }
        ++digits;
    }

    if (digits == 0) {
        throw std::invalid_argument("Malformed decimal: " + std::string(text));
    }

    Decimal result;
    result.m_mantissa = mantissa;
    result.m_scale = scale;
    result.normalize();
    return result;
}

bool Decimal::isMultipleOf(const Decimal& step) const
{
    if (!step.isPositive()) {
        throw std::invalid_argument("Step must be positive");
    }
    int common = std::max(m_scale, step.m_scale);
    Mantissa value = rescale(m_mantissa, m_scale, common);
    Mantissa unit = rescale(step.m_mantissa, step.m_scale, common);
    return value % unit == 0;
}

std::string Decimal::toString() const
{
    // No std::to_string for 128-bit integers
    using Magnitude = unsigned __int128;
    Magnitude magnitude = m_mantissa < 0 ? Magnitude{0} - static_cast<Magnitude>(m_mantissa)
                                         : static_cast<Magnitude>(m_mantissa);
    std::string digits;
    do {
        digits.push_back(static_cast<char>('0' + static_cast<int>(magnitude % 10)));
        magnitude /= 10;
    } while (magnitude != 0);
    std::reverse(digits.begin(), digits.end());

    if (m_scale > 0) {
        if (digits.size() <= static_cast<size_t>(m_scale)) {
            digits.insert(0, static_cast<size_t>(m_scale) - digits.size() + 1, '0');
        }
        digits.insert(digits.size() - static_cast<size_t>(m_scale), 1, '.');
    }

    if (m_mantissa < 0) {
        digits.insert(0, 1, '-');
    }
    return digits;
}

int Decimal::compare(const Decimal& a, const Decimal& b)
{
    // Integral parts first, then the fractional remainders at a common scale.
    // Remainders are below 10^MaxScale, so aligning them cannot overflow.
    Mantissa integralA = a.m_mantissa / kPowersOfTen[a.m_scale];
    Mantissa integralB = b.m_mantissa / kPowersOfTen[b.m_scale];
    if (integralA != integralB) {
        return integralA < integralB ? -1 : 1;
    }

    int common = std::max(a.m_scale, b.m_scale);
    Mantissa fractionA = (a.m_mantissa % kPowersOfTen[a.m_scale]) * kPowersOfTen[common - a.m_scale];
    Mantissa fractionB = (b.m_mantissa % kPowersOfTen[b.m_scale]) * kPowersOfTen[common - b.m_scale];
    if (fractionA != fractionB) {
        return fractionA < fractionB ? -1 : 1;
    }
    return 0;
}

Decimal& Decimal::operator+=(const Decimal& other)
{
    int common = std::max(m_scale, other.m_scale);
    Mantissa lhs = rescale(m_mantissa, m_scale, common);
    Mantissa rhs = rescale(other.m_mantissa, other.m_scale, common);
    if (__builtin_add_overflow(lhs, rhs, &m_mantissa)) {
        throw std::overflow_error("Decimal overflow in addition");
    }
    m_scale = common;
    normalize();
    return *this;
}

Decimal& Decimal::operator-=(const Decimal& other)
{
    int common = std::max(m_scale, other.m_scale);
    Mantissa lhs = rescale(m_mantissa, m_scale, common);
    Mantissa rhs = rescale(other.m_mantissa, other.m_scale, common);
    if (__builtin_sub_overflow(lhs, rhs, &m_mantissa)) {
        throw std::overflow_error("Decimal overflow in subtraction");
    }
    m_scale = common;
    normalize();
    return *this;
}

Decimal operator*(const Decimal& a, const Decimal& b)
{
    Decimal result;
    result.m_mantissa = checkedMultiply(a.m_mantissa, b.m_mantissa);
    result.m_scale = a.m_scale + b.m_scale;
    result.normalize();
    if (result.m_scale > Decimal::MaxScale) {
        throw std::overflow_error("Decimal product needs more than 36 fractional digits");
    }
    return result;
}

void Decimal::normalize()
{
    if (m_mantissa == 0) {
        m_scale = 0;
        return;
    }
    while (m_scale > 0 && m_mantissa % 10 == 0) {
        m_mantissa /= 10;
        --m_scale;
    }
}

std::ostream& operator<<(std::ostream& out, const Decimal& value) { return out << value.toString(); }

} // namespace oceanbook

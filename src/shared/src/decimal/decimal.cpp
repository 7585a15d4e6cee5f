#include "decimal.hpp"
#include "general/errors.hpp"
#include <algorithm>

namespace {
bool round_away(const BigUInt& q, const BigUInt& r, const BigUInt& den,
    bool negative, RoundingMode mode)
{
    if (r.is_zero())
        return false;
    auto cmp { r.mul_small(2) <=> den };
    switch (mode) {
    case RoundingMode::HalfUp:
        return cmp >= 0;
    case RoundingMode::HalfDown:
        return cmp > 0;
    case RoundingMode::HalfEven:
        return cmp > 0 || (cmp == 0 && q.is_odd());
    case RoundingMode::Floor:
        return negative;
    case RoundingMode::Ceil:
        return !negative;
    case RoundingMode::Truncate:
        return false;
    }
    return false;
}

BigUInt divide_rounded(const BigUInt& num, const BigUInt& den, bool negative, RoundingMode mode)
{
    auto [q, r] { BigUInt::divmod(num, den) };
    if (round_away(q, r, den, negative, mode))
        return q + BigUInt(1);
    return q;
}
}

std::optional<RoundingMode> parse_rounding_mode(std::string_view s)
{
    if (s == "HALF_UP")
        return RoundingMode::HalfUp;
    if (s == "HALF_DOWN")
        return RoundingMode::HalfDown;
    if (s == "HALF_EVEN" || s == "BANKERS")
        return RoundingMode::HalfEven;
    if (s == "FLOOR")
        return RoundingMode::Floor;
    if (s == "CEIL")
        return RoundingMode::Ceil;
    if (s == "TRUNCATE")
        return RoundingMode::Truncate;
    return {};
}

const char* to_string(RoundingMode m)
{
    switch (m) {
    case RoundingMode::HalfUp:
        return "HALF_UP";
    case RoundingMode::HalfDown:
        return "HALF_DOWN";
    case RoundingMode::HalfEven:
        return "HALF_EVEN";
    case RoundingMode::Floor:
        return "FLOOR";
    case RoundingMode::Ceil:
        return "CEIL";
    case RoundingMode::Truncate:
        return "TRUNCATE";
    }
    return "HALF_UP";
}

Decimal::Decimal(int64_t v)
    : negative(v < 0)
    , mag(v < 0 ? uint64_t(0) - uint64_t(v) : uint64_t(v))
{
}

Decimal Decimal::from_unscaled(BigUInt mag, bool negative, uint32_t scale)
{
    return { negative, std::move(mag), scale };
}

std::optional<Decimal> Decimal::parse(std::string_view s)
{
    bool neg { false };
    if (!s.empty() && (s[0] == '-' || s[0] == '+')) {
        neg = s[0] == '-';
        s = s.substr(1);
    }
    auto dot { s.find('.') };
    std::string_view intPart { s.substr(0, dot) };
    std::string_view fracPart;
    if (dot != std::string_view::npos) {
        fracPart = s.substr(dot + 1);
        if (fracPart.empty())
            return {};
    }
    if (intPart.empty() || fracPart.size() > maxScale)
        return {};
    std::string digits;
    digits.reserve(intPart.size() + fracPart.size());
    digits += intPart;
    digits += fracPart;
    auto m { BigUInt::from_digits(digits) };
    if (!m)
        return {};
    return Decimal { neg, std::move(*m), uint32_t(fracPart.size()) };
}

Decimal Decimal::parse_throw(std::string_view s)
{
    if (auto d { parse(s) })
        return *d;
    throw Error(INVALID_DECIMAL);
}

std::string Decimal::to_string() const
{
    std::string digits { mag.to_string() };
    if (sc > 0) {
        if (digits.size() <= sc)
            digits.insert(0, sc + 1 - digits.size(), '0');
        digits.insert(digits.size() - sc, 1, '.');
    }
    if (negative)
        digits.insert(0, 1, '-');
    return digits;
}

std::string Decimal::canonical_string() const
{
    auto s { to_string() };
    if (sc == 0)
        return s;
    while (s.back() == '0')
        s.pop_back();
    if (s.back() == '.')
        s.pop_back();
    return s;
}

Decimal Decimal::abs() const
{
    return { false, mag, sc };
}

Decimal Decimal::operator-() const
{
    return { !negative, mag, sc };
}

Decimal Decimal::round(uint32_t scale, RoundingMode mode) const
{
    if (scale >= sc)
        return { negative, aligned(scale), scale };
    auto den { BigUInt::pow10(sc - scale) };
    return { negative, divide_rounded(mag, den, negative, mode), scale };
}

std::optional<Decimal> Decimal::div(const Decimal& a, const Decimal& b,
    uint32_t scale, RoundingMode mode)
{
    if (b.is_zero())
        return {};
    // a/b = A*10^(sb+scale) / (B*10^sa) in units of 10^-scale
    auto num { a.mag.scale10(b.sc + scale) };
    auto den { b.mag.scale10(a.sc) };
    bool neg { a.negative != b.negative };
    return Decimal { neg, divide_rounded(num, den, neg, mode), scale };
}

Decimal Decimal::div_throw(const Decimal& a, const Decimal& b,
    uint32_t scale, RoundingMode mode)
{
    if (auto d { div(a, b, scale, mode) })
        return *d;
    throw Error(DIVISION_BY_ZERO);
}

Decimal Decimal::div_or_zero(const Decimal& a, const Decimal& b,
    uint32_t scale, RoundingMode mode)
{
    if (auto d { div(a, b, scale, mode) })
        return *d;
    return Decimal::zero().round(scale);
}

Decimal Decimal::percent(const Decimal& value, const Decimal& rate)
{
    auto p { value * rate };
    return { p.negative, std::move(p.mag), p.sc + 2 };
}

std::vector<Decimal> Decimal::allocate(const Decimal& amount,
    const std::vector<Decimal>& weights, uint32_t scale)
{
    std::vector<Decimal> out;
    if (weights.empty())
        return out;
    Decimal sum;
    for (auto& w : weights)
        sum += w;
    const bool equal { sum.is_zero() };
    if (equal)
        sum = Decimal(int64_t(weights.size()));

    const auto total { amount.round(scale) };
    Decimal assigned;
    out.reserve(weights.size());
    for (size_t i = 0; i + 1 < weights.size(); ++i) {
        auto share { div_throw(total * (equal ? Decimal(1) : weights[i]), sum, scale) };
        assigned += share;
        out.push_back(std::move(share));
    }
    out.push_back(total - assigned);
    return out;
}

Decimal Decimal::clamp(const Decimal& v, const std::optional<Decimal>& lo, const std::optional<Decimal>& hi)
{
    if (hi && v > *hi)
        return *hi;
    if (lo && v < *lo)
        return *lo;
    return v;
}

Decimal operator+(const Decimal& a, const Decimal& b)
{
    const uint32_t scale { std::max(a.sc, b.sc) };
    auto ma { a.aligned(scale) };
    auto mb { b.aligned(scale) };
    if (a.negative == b.negative)
        return { a.negative, ma + mb, scale };
    if (ma >= mb)
        return { a.negative, ma - mb, scale };
    return { b.negative, mb - ma, scale };
}

Decimal operator-(const Decimal& a, const Decimal& b)
{
    return a + (-b);
}

Decimal operator*(const Decimal& a, const Decimal& b)
{
    return { a.negative != b.negative, a.mag * b.mag, a.sc + b.sc };
}

std::strong_ordering Decimal::operator<=>(const Decimal& other) const
{
    if (negative != other.negative)
        return negative ? std::strong_ordering::less : std::strong_ordering::greater;
    const uint32_t scale { std::max(sc, other.sc) };
    auto cmp { aligned(scale) <=> other.aligned(scale) };
    if (negative)
        return 0 <=> cmp;
    return cmp;
}

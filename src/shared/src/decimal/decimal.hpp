#pragma once
#include "biguint.hpp"
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class RoundingMode : uint8_t {
    HalfUp,
    HalfDown,
    HalfEven,
    Floor,
    Ceil,
    Truncate
};
std::optional<RoundingMode> parse_rounding_mode(std::string_view);
const char* to_string(RoundingMode);

// Exact fixed point decimal: value = (-1)^negative * mag * 10^-scale.
// Zero is never negative. Addition, subtraction and multiplication are
// exact, division and rounding take an explicit scale.
class Decimal {
public:
    static constexpr uint32_t maxScale { 64 };
    static constexpr uint32_t ratioScale { 10 };

    Decimal() = default;
    explicit Decimal(int64_t v);
    static Decimal zero() { return {}; }
    static Decimal from_unscaled(BigUInt mag, bool negative, uint32_t scale);

    [[nodiscard]] static std::optional<Decimal> parse(std::string_view);
    static Decimal parse_throw(std::string_view);

    std::string to_string() const;
    std::string to_string(uint32_t scale) const { return round(scale).to_string(); }
    // shortest representation, trailing fractional zeros removed
    std::string canonical_string() const;

    uint32_t scale() const { return sc; }
    bool is_zero() const { return mag.is_zero(); }
    bool is_negative() const { return negative; }
    bool is_positive() const { return !negative && !mag.is_zero(); }

    Decimal abs() const;
    Decimal operator-() const;
    [[nodiscard]] Decimal round(uint32_t scale, RoundingMode mode = RoundingMode::HalfUp) const;

    [[nodiscard]] static std::optional<Decimal> div(const Decimal& a, const Decimal& b,
        uint32_t scale, RoundingMode mode = RoundingMode::HalfUp);
    static Decimal div_throw(const Decimal& a, const Decimal& b,
        uint32_t scale, RoundingMode mode = RoundingMode::HalfUp);
    // a / b, or zero if b is zero
    static Decimal div_or_zero(const Decimal& a, const Decimal& b,
        uint32_t scale, RoundingMode mode = RoundingMode::HalfUp);

    // value * rate / 100, exact
    static Decimal percent(const Decimal& value, const Decimal& rate);

    // Splits amount proportionally to weights, rounded to scale. The last
    // share absorbs the rounding remainder so shares sum to the rounded
    // amount. A zero weight sum splits equally.
    static std::vector<Decimal> allocate(const Decimal& amount,
        const std::vector<Decimal>& weights, uint32_t scale);

    static Decimal min(const Decimal& a, const Decimal& b) { return b < a ? b : a; }
    static Decimal max(const Decimal& a, const Decimal& b) { return a < b ? b : a; }
    static Decimal clamp(const Decimal& v, const std::optional<Decimal>& lo, const std::optional<Decimal>& hi);

    friend Decimal operator+(const Decimal& a, const Decimal& b);
    friend Decimal operator-(const Decimal& a, const Decimal& b);
    friend Decimal operator*(const Decimal& a, const Decimal& b);
    Decimal& operator+=(const Decimal& d)
    {
        *this = *this + d;
        return *this;
    }
    Decimal& operator-=(const Decimal& d)
    {
        *this = *this - d;
        return *this;
    }

    std::strong_ordering operator<=>(const Decimal& other) const;
    bool operator==(const Decimal& other) const { return (*this <=> other) == 0; }

private:
    Decimal(bool negative, BigUInt mag, uint32_t scale)
        : negative(negative && !mag.is_zero())
        , mag(std::move(mag))
        , sc(scale)
    {
    }
    BigUInt aligned(uint32_t scale) const { return mag.scale10(scale - sc); }

    bool negative { false };
    BigUInt mag;
    uint32_t sc { 0 };
};

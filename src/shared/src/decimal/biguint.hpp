#pragma once
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Arbitrary size unsigned integer, little endian limbs in base 10^9.
// Zero is represented by an empty limb vector.
class BigUInt {
public:
    static constexpr uint32_t base { 1000000000 };
    static constexpr size_t limbDigits { 9 };

    BigUInt() = default;
    BigUInt(uint64_t v);
    [[nodiscard]] static std::optional<BigUInt> from_digits(std::string_view digits);
    std::string to_string() const;

    bool is_zero() const { return limbs.empty(); }
    bool is_odd() const { return !limbs.empty() && (limbs[0] & 1) != 0; }
    size_t limb_count() const { return limbs.size(); }

    // multiplies by 10^n
    [[nodiscard]] BigUInt scale10(size_t n) const;
    [[nodiscard]] BigUInt mul_small(uint32_t m) const;

    struct DivResult;
    [[nodiscard]] static DivResult divmod(const BigUInt& num, const BigUInt& den);
    [[nodiscard]] static BigUInt pow10(size_t n) { return BigUInt(1).scale10(n); }

    friend BigUInt operator+(const BigUInt& a, const BigUInt& b);
    friend BigUInt operator-(const BigUInt& a, const BigUInt& b); // throws if a < b
    friend BigUInt operator*(const BigUInt& a, const BigUInt& b);

    bool operator==(const BigUInt&) const = default;
    std::strong_ordering operator<=>(const BigUInt& other) const;

private:
    std::pair<BigUInt, uint32_t> divmod_small(uint32_t d) const;
    void trim();
    std::vector<uint32_t> limbs;
};

struct BigUInt::DivResult {
    BigUInt quotient;
    BigUInt remainder;
};

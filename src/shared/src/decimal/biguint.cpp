#include "biguint.hpp"
#include "general/errors.hpp"
#include <algorithm>

BigUInt::BigUInt(uint64_t v)
{
    while (v != 0) {
        limbs.push_back(uint32_t(v % base));
        v /= base;
    }
}

std::optional<BigUInt> BigUInt::from_digits(std::string_view digits)
{
    if (digits.empty())
        return {};
    BigUInt res;
    size_t end { digits.size() };
    while (end > 0) {
        size_t begin { end > limbDigits ? end - limbDigits : 0 };
        uint32_t limb { 0 };
        for (size_t i = begin; i < end; ++i) {
            char c { digits[i] };
            if (c < '0' || c > '9')
                return {};
            limb = limb * 10 + uint32_t(c - '0');
        }
        res.limbs.push_back(limb);
        end = begin;
    }
    res.trim();
    return res;
}

std::string BigUInt::to_string() const
{
    if (limbs.empty())
        return "0";
    std::string out { std::to_string(limbs.back()) };
    for (size_t i = limbs.size() - 1; i-- > 0;) {
        auto s { std::to_string(limbs[i]) };
        out.append(limbDigits - s.size(), '0');
        out += s;
    }
    return out;
}

BigUInt BigUInt::scale10(size_t n) const
{
    if (is_zero())
        return {};
    BigUInt res(*this);
    res.limbs.insert(res.limbs.begin(), n / limbDigits, 0);
    uint32_t m { 1 };
    for (size_t i = 0; i < n % limbDigits; ++i)
        m *= 10;
    return res.mul_small(m);
}

BigUInt BigUInt::mul_small(uint32_t m) const
{
    if (m == 0 || is_zero())
        return {};
    BigUInt res;
    res.limbs.reserve(limbs.size() + 1);
    uint64_t carry { 0 };
    for (auto l : limbs) {
        uint64_t cur { uint64_t(l) * m + carry };
        res.limbs.push_back(uint32_t(cur % base));
        carry = cur / base;
    }
    while (carry != 0) {
        res.limbs.push_back(uint32_t(carry % base));
        carry /= base;
    }
    return res;
}

std::pair<BigUInt, uint32_t> BigUInt::divmod_small(uint32_t d) const
{
    BigUInt q;
    q.limbs.resize(limbs.size());
    uint64_t rem { 0 };
    for (size_t i = limbs.size(); i-- > 0;) {
        uint64_t cur { rem * base + limbs[i] };
        q.limbs[i] = uint32_t(cur / d);
        rem = cur % d;
    }
    q.trim();
    return { q, uint32_t(rem) };
}

auto BigUInt::divmod(const BigUInt& num, const BigUInt& den) -> DivResult
{
    if (den.is_zero())
        throw Error(DIVISION_BY_ZERO);
    if (num < den)
        return { {}, num };
    if (den.limbs.size() == 1) {
        auto [q, r] { num.divmod_small(den.limbs[0]) };
        return { std::move(q), BigUInt(r) };
    }

    // schoolbook long division, one base 10^9 digit per step
    BigUInt q;
    q.limbs.resize(num.limbs.size());
    BigUInt r;
    for (size_t i = num.limbs.size(); i-- > 0;) {
        r.limbs.insert(r.limbs.begin(), num.limbs[i]);
        r.trim();
        uint32_t lo { 0 };
        uint32_t hi { base - 1 };
        while (lo < hi) {
            uint32_t mid { lo + (hi - lo + 1) / 2 };
            if (den.mul_small(mid) <= r)
                lo = mid;
            else
                hi = mid - 1;
        }
        if (lo != 0)
            r = r - den.mul_small(lo);
        q.limbs[i] = lo;
    }
    q.trim();
    return { std::move(q), std::move(r) };
}

BigUInt operator+(const BigUInt& a, const BigUInt& b)
{
    BigUInt res;
    const size_t n { std::max(a.limbs.size(), b.limbs.size()) };
    res.limbs.reserve(n + 1);
    uint32_t carry { 0 };
    for (size_t i = 0; i < n; ++i) {
        uint32_t cur { carry };
        if (i < a.limbs.size())
            cur += a.limbs[i];
        if (i < b.limbs.size())
            cur += b.limbs[i];
        carry = cur >= BigUInt::base ? 1 : 0;
        res.limbs.push_back(cur - carry * BigUInt::base);
    }
    if (carry)
        res.limbs.push_back(carry);
    return res;
}

BigUInt operator-(const BigUInt& a, const BigUInt& b)
{
    if (a < b)
        throw Error(EBUG);
    BigUInt res;
    res.limbs.reserve(a.limbs.size());
    int64_t borrow { 0 };
    for (size_t i = 0; i < a.limbs.size(); ++i) {
        int64_t cur { int64_t(a.limbs[i]) - borrow };
        if (i < b.limbs.size())
            cur -= b.limbs[i];
        borrow = cur < 0 ? 1 : 0;
        res.limbs.push_back(uint32_t(cur + borrow * int64_t(BigUInt::base)));
    }
    res.trim();
    return res;
}

BigUInt operator*(const BigUInt& a, const BigUInt& b)
{
    if (a.is_zero() || b.is_zero())
        return {};
    BigUInt res;
    res.limbs.assign(a.limbs.size() + b.limbs.size(), 0);
    for (size_t i = 0; i < a.limbs.size(); ++i) {
        uint64_t carry { 0 };
        for (size_t j = 0; j < b.limbs.size(); ++j) {
            uint64_t cur { res.limbs[i + j] + uint64_t(a.limbs[i]) * b.limbs[j] + carry };
            res.limbs[i + j] = uint32_t(cur % BigUInt::base);
            carry = cur / BigUInt::base;
        }
        size_t k { i + b.limbs.size() };
        while (carry != 0) {
            uint64_t cur { res.limbs[k] + carry };
            res.limbs[k] = uint32_t(cur % BigUInt::base);
            carry = cur / BigUInt::base;
            k += 1;
        }
    }
    res.trim();
    return res;
}

std::strong_ordering BigUInt::operator<=>(const BigUInt& other) const
{
    if (limbs.size() != other.limbs.size())
        return limbs.size() <=> other.limbs.size();
    for (size_t i = limbs.size(); i-- > 0;) {
        if (limbs[i] != other.limbs[i])
            return limbs[i] <=> other.limbs[i];
    }
    return std::strong_ordering::equal;
}

void BigUInt::trim()
{
    while (!limbs.empty() && limbs.back() == 0)
        limbs.pop_back();
}

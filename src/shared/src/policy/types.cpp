#include "types.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <string>

namespace {
std::string upper(std::string_view s)
{
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return char(std::toupper(c));
    });
    return out;
}

template <typename E, size_t N>
std::optional<E> lookup(std::string_view s, const std::array<E, N>& values)
{
    const auto u { upper(s) };
    for (auto v : values) {
        if (u == to_string(v))
            return v;
    }
    return {};
}
}

const char* to_string(ComponentType t)
{
    switch (t) {
    case ComponentType::Rate:
        return "RATE";
    case ComponentType::RatePP:
        return "RATE_PP";
    case ComponentType::FixedUnit:
        return "FIXED_UNIT";
    case ComponentType::FixedOrder:
        return "FIXED_ORDER";
    case ComponentType::Tier:
        return "TIER";
    case ComponentType::Cap:
        return "CAP";
    case ComponentType::Override:
        return "OVERRIDE";
    }
    return "RATE";
}

const char* to_string(Scope s)
{
    return s == Scope::Order ? "ORDER" : "LINE";
}

const char* to_string(ProrationMethod m)
{
    switch (m) {
    case ProrationMethod::ByNet:
        return "BY_NET";
    case ProrationMethod::ByGross:
        return "BY_GROSS";
    case ProrationMethod::ByQuantity:
        return "BY_QUANTITY";
    case ProrationMethod::Equal:
        return "EQUAL";
    }
    return "BY_NET";
}

const char* to_string(RefundBehavior b)
{
    switch (b) {
    case RefundBehavior::Proportional:
        return "PROPORTIONAL";
    case RefundBehavior::FixedOnly:
        return "FIXED_ONLY";
    case RefundBehavior::None:
        return "NONE";
    }
    return "PROPORTIONAL";
}

const char* to_string(TierBoundary b)
{
    return b == TierBoundary::ClosedClosed ? "CLOSED_CLOSED" : "CLOSED_OPEN";
}

const char* to_string(SelectorMode m)
{
    return m == SelectorMode::Include ? "INCLUDE" : "EXCLUDE";
}

std::optional<ComponentType> parse_component_type(std::string_view s)
{
    return lookup(s, std::array { ComponentType::Rate, ComponentType::RatePP, ComponentType::FixedUnit, ComponentType::FixedOrder, ComponentType::Tier, ComponentType::Cap, ComponentType::Override });
}

std::optional<Scope> parse_scope(std::string_view s)
{
    return lookup(s, std::array { Scope::Order, Scope::Line });
}

std::optional<ProrationMethod> parse_proration_method(std::string_view s)
{
    return lookup(s, std::array { ProrationMethod::ByNet, ProrationMethod::ByGross, ProrationMethod::ByQuantity, ProrationMethod::Equal });
}

std::optional<RefundBehavior> parse_refund_behavior(std::string_view s)
{
    return lookup(s, std::array { RefundBehavior::Proportional, RefundBehavior::FixedOnly, RefundBehavior::None });
}

std::optional<TierBoundary> parse_tier_boundary(std::string_view s)
{
    return lookup(s, std::array { TierBoundary::ClosedClosed, TierBoundary::ClosedOpen });
}

std::optional<SelectorMode> parse_selector_mode(std::string_view s)
{
    return lookup(s, std::array { SelectorMode::Include, SelectorMode::Exclude });
}

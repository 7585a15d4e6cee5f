#pragma once
#include <cstdint>
#include <optional>
#include <string_view>

// order of enumerators matches the alternatives of the Rule variant
enum class ComponentType : uint8_t {
    Rate,
    RatePP,
    FixedUnit,
    FixedOrder,
    Tier,
    Cap,
    Override
};

enum class Scope : uint8_t {
    Order,
    Line
};

enum class ProrationMethod : uint8_t {
    ByNet,
    ByGross,
    ByQuantity,
    Equal
};

enum class RefundBehavior : uint8_t {
    Proportional,
    FixedOnly,
    None
};

enum class TierBoundary : uint8_t {
    ClosedClosed,
    ClosedOpen
};

enum class SelectorMode : uint8_t {
    Include,
    Exclude
};

const char* to_string(ComponentType);
const char* to_string(Scope);
const char* to_string(ProrationMethod);
const char* to_string(RefundBehavior);
const char* to_string(TierBoundary);
const char* to_string(SelectorMode);

// parsing is case insensitive
std::optional<ComponentType> parse_component_type(std::string_view);
std::optional<Scope> parse_scope(std::string_view);
std::optional<ProrationMethod> parse_proration_method(std::string_view);
std::optional<RefundBehavior> parse_refund_behavior(std::string_view);
std::optional<TierBoundary> parse_tier_boundary(std::string_view);
std::optional<SelectorMode> parse_selector_mode(std::string_view);

inline bool is_fixed_type(ComponentType t)
{
    return t == ComponentType::FixedUnit || t == ComponentType::FixedOrder;
}

// CAP and OVERRIDE rewrite prior breakdown entries
inline bool is_modifier_type(ComponentType t)
{
    return t == ComponentType::Cap || t == ComponentType::Override;
}

#pragma once
#include "base_spec.hpp"
#include "condition.hpp"
#include "decimal/decimal.hpp"
#include "types.hpp"
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

struct TierBracket {
    Decimal min;
    std::optional<Decimal> max; // open ended if absent
    std::optional<Decimal> rate;
    std::optional<Decimal> fixed;

    bool contains(const Decimal& v, TierBoundary boundary) const
    {
        if (v < min)
            return false;
        if (!max)
            return true;
        return boundary == TierBoundary::ClosedClosed ? v <= *max : v < *max;
    }
};

struct CapTargets {
    std::vector<std::string> componentIds;
    std::vector<std::string> tagsAny;
    std::vector<ComponentType> types;
    std::vector<Scope> scopes;
    bool empty() const
    {
        return componentIds.empty() && tagsAny.empty() && types.empty() && scopes.empty();
    }
};

namespace rule {
struct Rate {
    Decimal rate;
};
struct RatePP {
    Decimal pp;
};
struct FixedUnit {
    Decimal fixed;
};
struct FixedOrder {
    Decimal fixed;
};
struct Tier {
    std::optional<std::string> tierBy; // field selecting the bracket, the base if absent
    std::vector<TierBracket> tiers;
};
struct Cap {
    std::optional<Decimal> min;
    std::optional<Decimal> max;
    std::optional<CapTargets> targets; // all prior components if absent
};
struct Override {
    std::vector<std::string> excludes;
    std::vector<std::string> excludeTags;
    std::string reason;
    std::optional<Decimal> replacement;
};
}

using Rule = std::variant<rule::Rate, rule::RatePP, rule::FixedUnit, rule::FixedOrder,
    rule::Tier, rule::Cap, rule::Override>;

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

struct RefundConfig {
    bool refundable { true };
    RefundBehavior behavior { RefundBehavior::Proportional };
    bool capRefundToOriginal { true };
};

struct Component {
    std::string id;
    std::string name;
    Scope scope { Scope::Line };
    int32_t precedence { 100 };
    BaseSpec base;
    std::set<std::string> tags;
    std::vector<Condition> conditions;
    std::optional<LineSelector> lineSelector;
    std::optional<ProrationMethod> proration;
    RefundConfig refund;
    Rule rule;

    ComponentType type() const { return ComponentType(rule.index()); }
    bool has_tag(const std::string& tag) const { return tags.contains(tag); }
    static Scope default_scope(ComponentType t)
    {
        switch (t) {
        case ComponentType::FixedOrder:
        case ComponentType::Cap:
        case ComponentType::Override:
            return Scope::Order;
        default:
            return Scope::Line;
        }
    }
};

#include "policy.hpp"
#include "crypto/hasher_sha256.hpp"
#include "nlohmann/json.hpp"
#include <algorithm>
#include <set>

Result<void> Policy::validate() const
{
    if (precision > maxPrecision)
        return { INVALID_POLICY, "precision must not exceed 18" };
    std::set<std::string> ids;
    for (auto& c : components) {
        if (c.id.empty())
            return { INVALID_COMPONENT, "component without component_id" };
        if (!ids.insert(c.id).second)
            return { INVALID_COMPONENT, "duplicate component_id \"" + c.id + "\"" };
        if (auto t { std::get_if<rule::Tier>(&c.rule) }) {
            if (t->tiers.empty())
                return { INVALID_COMPONENT, "tier component \"" + c.id + "\" has no tiers" };
            for (auto& b : t->tiers) {
                if (b.max && *b.max < b.min)
                    return { INVALID_COMPONENT, "tier component \"" + c.id + "\" has a bracket with max below min" };
                if (!b.rate && !b.fixed)
                    return { INVALID_COMPONENT, "tier component \"" + c.id + "\" has a bracket without rate or fixed" };
            }
        }
        if (auto cap { std::get_if<rule::Cap>(&c.rule) }) {
            if (!cap->min && !cap->max)
                return { INVALID_COMPONENT, "cap component \"" + c.id + "\" needs min or max" };
            if (cap->min && cap->max && *cap->max < *cap->min)
                return { CAP_INVALID_BOUNDS, "cap component \"" + c.id + "\": min " + cap->min->to_string() + " exceeds max " + cap->max->to_string() };
        }
    }
    return {};
}

const Component* Policy::find(const std::string& componentId) const
{
    for (auto& c : components) {
        if (c.id == componentId)
            return &c;
    }
    return nullptr;
}

std::vector<const Component*> Policy::evaluation_order() const
{
    std::vector<const Component*> out;
    out.reserve(components.size());
    for (auto& c : components)
        out.push_back(&c);
    std::stable_sort(out.begin(), out.end(), [](const Component* a, const Component* b) {
        return a->precedence < b->precedence;
    });
    return out;
}

std::string Policy::hash() const
{
    auto h { hashSHA256(canonical_json().dump()) };
    return "v2:" + h.hex_string().substr(0, 16);
}

Policy make_simple_rate_policy(std::string channelKey, Decimal rate, Scope scope, BaseSpec base)
{
    Policy p;
    p.policyKey = channelKey + "_rate";
    p.channelKey = std::move(channelKey);
    Component c;
    c.id = "platform_fee";
    c.name = "Platform Fee";
    c.scope = scope;
    c.base = std::move(base);
    c.tags = { "platform_fee" };
    c.rule = rule::Rate { std::move(rate) };
    p.components.push_back(std::move(c));
    return p;
}

Policy make_tiered_policy(std::string channelKey, std::vector<TierBracket> tiers, std::string tierBy)
{
    Policy p;
    p.policyKey = channelKey + "_tiered";
    p.channelKey = std::move(channelKey);
    Component c;
    c.id = "tiered_fee";
    c.name = "Tiered Fee";
    c.scope = Scope::Line;
    c.tags = { "platform_fee", "tiered" };
    c.rule = rule::Tier { std::move(tierBy), std::move(tiers) };
    p.components.push_back(std::move(c));
    return p;
}

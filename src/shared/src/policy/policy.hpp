#pragma once
#include "component.hpp"
#include "general/result.hpp"
#include "nlohmann/json_fwd.hpp"
#include <optional>
#include <string>
#include <vector>

struct Policy {
    static constexpr uint8_t maxPrecision { 18 };

    std::string policyKey;
    uint32_t version { 1 };
    std::string channelKey;
    std::string currency { "CLP" };
    uint8_t precision { 2 };
    TierBoundary tierBoundary { TierBoundary::ClosedClosed };
    bool strict { false };

    // effective dating, used by the repository
    std::optional<std::string> scopeId;
    std::string effectiveFrom { "1970-01-01" };
    std::string effectiveTo { "9999-12-31" };
    bool active { true };

    std::vector<Component> components;

    [[nodiscard]] Result<void> validate() const;
    const Component* find(const std::string& componentId) const;

    // components sorted by precedence, ties keep declaration order
    std::vector<const Component*> evaluation_order() const;

    // Canonical form: keys sorted, components in evaluation order,
    // decimals without trailing zeros. Effective dating is excluded.
    nlohmann::json canonical_json() const;
    // "v2:" followed by the first 16 hex digits of the canonical SHA256
    std::string hash() const;

    [[nodiscard]] static Result<Policy> from_json(const nlohmann::json&);
    nlohmann::json to_json() const;
};

// single RATE component named platform_fee
Policy make_simple_rate_policy(std::string channelKey, Decimal rate,
    Scope scope = Scope::Line, BaseSpec base = BaseSpec::field("net"));

// single TIER component named tiered_fee
Policy make_tiered_policy(std::string channelKey, std::vector<TierBracket> tiers,
    std::string tierBy = "unit_price");

#pragma once
#include "policy/component.hpp"
#include "transaction.hpp"
#include "nlohmann/json_fwd.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

// Soft anomaly, never blocks a calculation.
struct Warning {
    std::string code;
    std::string message;
    std::optional<std::string> componentId;
};

struct TierSelected {
    std::optional<std::string> lineId; // absent for order scope
    Decimal value; // value the bracket was chosen by
    TierBracket bracket;
};

struct CapApplied {
    std::string bound; // "max", "min" or "none"
    std::optional<Decimal> limit;
    Decimal targetSumBefore;
    Decimal delta;
    std::vector<std::string> targetsMatched;
};

struct BreakdownEntry {
    std::string componentId;
    std::string componentName;
    ComponentType type { ComponentType::Rate };
    Scope scope { Scope::Line };
    int32_t precedence { 100 };
    Decimal amount;
    std::optional<Decimal> baseUsed;
    std::string baseSpec;
    std::optional<Decimal> rate;
    std::optional<Decimal> fixed;
    std::vector<TierSelected> tierSelected;
    std::optional<CapApplied> capApplied;
    std::optional<Decimal> capDelta;
    std::optional<std::string> overrideReason;
    bool applied { true };
    std::optional<std::string> discardReason;
    std::vector<std::string> tags; // sorted
    RefundConfig refund;
    ProrationMethod proration { ProrationMethod::ByNet };
    std::vector<std::string> appliedLineIds;
    size_t excludedLineCount { 0 };

    bool has_tag(const std::string& tag) const;
    void discard(std::string reason)
    {
        applied = false;
        amount = Decimal::zero();
        discardReason = std::move(reason);
    }
    // money is printed with `precision` decimals
    nlohmann::json to_json(uint8_t precision) const;
    [[nodiscard]] static Result<BreakdownEntry> from_json(const nlohmann::json&);
};

struct LineContribution {
    std::string componentId;
    Decimal amount;
    ProrationMethod proration { ProrationMethod::ByNet };
    Decimal weight; // share of the component, scale 10
};

struct LineAllocation {
    std::string lineId;
    Decimal feeAmount;
    std::vector<LineContribution> components;
};

struct Reconciliation {
    Decimal allocatedSum;
    Decimal difference;
    bool balanced { true };
};

struct DiscardedComponent {
    std::string componentId;
    std::string reason;
};

struct CapTargeting {
    std::string capId;
    std::vector<std::string> targets;
};

struct LineCoverage {
    std::vector<std::string> applied;
    std::vector<std::string> excluded;
};

struct ExplainPlan {
    std::vector<std::string> evaluationOrder;
    std::vector<std::string> componentsEligible;
    std::vector<DiscardedComponent> componentsDiscarded;
    std::vector<CapTargeting> capTargeting;
    std::map<std::string, LineCoverage> lineCoverage;
};

struct CalculationMeta {
    std::string engineVersion;
    std::string signature;
    std::string policyHash;
    uint8_t precision { 2 };
    std::string policyKey;
    uint32_t policyVersion { 1 };
};

struct Calculation {
    std::string transactionId; // as given, may be empty
    std::string channelKey;
    std::string currency;
    uint8_t precision { 2 };
    Decimal totalFee;
    std::vector<BreakdownEntry> breakdown;
    std::vector<LineAllocation> allocation;
    std::vector<Warning> warnings;
    Reconciliation reconciliation;
    ExplainPlan explain;
    CalculationMeta meta;
    NormalizedInput input;

    const BreakdownEntry* find(const std::string& componentId) const;
    const LineAllocation* line(const std::string& lineId) const;
    nlohmann::json to_json() const;
};

nlohmann::json to_json(const Warning&);
nlohmann::json to_json(const LineAllocation&, uint8_t precision);
nlohmann::json to_json(const Reconciliation&, uint8_t precision);
nlohmann::json to_json(const ExplainPlan&);
nlohmann::json to_json(const NormalizedInput&);
[[nodiscard]] Result<Warning> warning_from_json(const nlohmann::json&);
[[nodiscard]] Result<LineAllocation> allocation_from_json(const nlohmann::json&);

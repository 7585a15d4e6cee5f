#pragma once
#include "engine/calculator.hpp"
#include "interfaces.hpp"
#include <map>

struct LedgerOptions {
    CalculateOptions calculation;
    bool strict { false }; // strict adjustment checks
    bool allowNegativeRunning { false };
    std::optional<Source> source;
};

// display form of one breakdown entry
struct FeeSummaryItem {
    std::string id;
    std::string name;
    ComponentType type { ComponentType::Rate };
    Decimal amount;
    std::vector<std::string> tags;
    std::string details;
};

struct SettleResult {
    LedgerEntry entry;
    std::vector<FeeSummaryItem> fees;
    bool replayed { false };
};

struct LineRefund {
    std::string lineId;
    Decimal amount;
};

struct Adjustment {
    AdjustmentMode mode { AdjustmentMode::Auto };
    EventType eventType { EventType::Adjust };
    std::optional<Decimal> amount; // refunded order amount, AUTO mode
    std::optional<Decimal> feeAmount; // fee to debit, MANUAL mode
    std::optional<std::string> currency;
    std::string reason;
    std::vector<LineRefund> lineRefunds;
    std::optional<std::string> idempotencyKey;

    [[nodiscard]] static Result<Adjustment> from_json(const nlohmann::json&);
};

struct AdjustResult {
    LedgerEntry entry;
    Decimal feeAdjustment; // negative
    Decimal runningTotal;
    std::vector<RefundPlanItem> refundPlan;
    AdjustmentCoverage coverage;
    bool replayed { false };
};

struct ComponentTotal {
    std::string componentId;
    Decimal settled;
    Decimal adjusted;
    Decimal net() const { return settled + adjusted; }
};

struct TransactionFees {
    std::string transactionId;
    uint8_t precision { 2 };
    Decimal totalFees;
    Decimal totalAdjustments;
    Decimal netFees;
    size_t entriesCount { 0 };
    std::vector<ComponentTotal> breakdown;
    nlohmann::json to_json() const;
};

// Orchestrates calculation and persistence. Holds no locks and keeps no
// state between calls, serialization of concurrent adjustments of one
// entry is the job of the store.
class FeeLedger {
public:
    FeeLedger(LedgerCallbacks callbacks, LedgerOptions options = {})
        : callbacks(callbacks)
        , options(std::move(options))
    {
    }

    [[nodiscard]] Result<SettleResult> settle(const Transaction&);
    [[nodiscard]] Result<Calculation> simulate(const Transaction&, const Policy&) const;
    [[nodiscard]] Result<LineAllocation> calculate_for_item(const LineInput&, const Policy&) const;
    [[nodiscard]] Result<AdjustResult> adjust(EntryId originalEntryId, const Adjustment&);
    [[nodiscard]] Result<TransactionFees> transaction_fees(const std::string& transactionId);

    static std::vector<FeeSummaryItem> fee_summary(const std::vector<BreakdownEntry>&, uint8_t precision);

private:
    struct RefundComputation {
        Decimal total; // negative
        std::vector<RefundPlanItem> plan;
        std::vector<BreakdownEntry> breakdown;
    };
    [[nodiscard]] Result<RefundComputation> compute_refund(const LedgerEntry& original,
        const Adjustment&, const Decimal& amount) const;

    LedgerCallbacks callbacks;
    LedgerOptions options;
};

nlohmann::json to_json(const SettleResult&);
nlohmann::json to_json(const AdjustResult&);

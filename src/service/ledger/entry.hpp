#pragma once
#include "engine/result.hpp"
#include "general/with_uint64.hpp"
#include "policy/policy.hpp"
#include <optional>
#include <string>
#include <vector>

class EntryId : public IsUint64 { // assigned by storage
public:
    using IsUint64::IsUint64;
    bool operator==(const EntryId&) const = default;
    auto operator<=>(const EntryId&) const = default;
};

enum class EventType : uint8_t {
    Settle,
    Adjust,
    Refund,
    Chargeback
};

enum class EntryStatus : uint8_t {
    Active,
    Adjusted,
    Reversed
};

enum class AdjustmentMode : uint8_t {
    Auto,
    Manual
};

const char* to_string(EventType);
const char* to_string(EntryStatus);
const char* to_string(AdjustmentMode);
std::optional<EventType> parse_event_type(std::string_view);
std::optional<EntryStatus> parse_entry_status(std::string_view);
std::optional<AdjustmentMode> parse_adjustment_mode(std::string_view);

// origin of an entry in the host application
struct Source {
    std::string module;
    std::string objectType;
    std::string objectId;
    std::optional<std::string> scopeId;
};

struct PolicySnapshot {
    std::string policyKey;
    uint32_t version { 1 };
    size_t componentsCount { 0 };
    std::string policyHash;
};

struct InputSnapshot {
    size_t linesCount { 0 };
    OrderTotals order;
    std::vector<std::string> lineIds;
};

struct RefundPlanItem {
    std::string componentId;
    ComponentType type { ComponentType::Rate };
    Decimal originalAmount;
    Decimal refundAmount; // positive, the entry books its negation
    std::string reason;
};

struct AdjustmentCoverage {
    std::vector<std::string> affectedLines;
    std::vector<std::string> unaffectedLines;
};

struct AdjustmentInfo {
    AdjustmentMode mode { AdjustmentMode::Auto };
    Decimal amount;
    std::string reason;
    AdjustmentCoverage coverage;
};

// Immutable record of a settlement or an adjustment. Only the status of
// a stored entry ever changes.
struct LedgerEntry {
    std::optional<EntryId> entryId;
    std::string transactionId;
    std::optional<EntryId> parentEntryId;
    std::string channelKey;
    std::string asOf;
    EventType eventType { EventType::Settle };
    EntryStatus status { EntryStatus::Active };
    std::string currency;
    uint8_t precision { 2 };
    Decimal totalFee;
    std::vector<BreakdownEntry> breakdown;
    std::vector<LineAllocation> allocation;
    std::vector<Warning> warnings;
    std::vector<RefundPlanItem> refundPlan;
    PolicySnapshot policySnapshot;
    InputSnapshot inputSnapshot;
    std::optional<AdjustmentInfo> adjustment;
    std::string signature;
    std::optional<std::string> idempotencyKey;
    std::optional<Source> source;
    std::string createdAt;

    const BreakdownEntry* find(const std::string& componentId) const;
    nlohmann::json to_json() const;
    [[nodiscard]] static Result<LedgerEntry> from_json(const nlohmann::json&);
};

struct EntryPatch {
    std::optional<EntryStatus> status;
};

nlohmann::json to_json(const InputSnapshot&, uint8_t precision);
nlohmann::json to_json(const AdjustmentInfo&, uint8_t precision);
[[nodiscard]] Result<InputSnapshot> input_snapshot_from_json(const nlohmann::json&);
[[nodiscard]] Result<AdjustmentInfo> adjustment_from_json(const nlohmann::json&);

// SETTLE entry for a successful calculation, not yet stored
LedgerEntry make_settle_entry(const Calculation&, const Policy&, std::string asOf,
    std::optional<std::string> idempotencyKey = {}, std::optional<Source> source = {});

// current UTC time as 2024-01-31T12:00:00Z and the date part of it
std::string now_iso8601();
std::string today_iso8601();

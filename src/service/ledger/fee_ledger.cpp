#include "fee_ledger.hpp"
#include "crypto/hasher_sha256.hpp"
#include "general/logging.hpp"
#include "nlohmann/json.hpp"
#include "policy/json_reader.hpp"
#include <algorithm>

using nlohmann::json;

namespace {
std::string details(const BreakdownEntry& e, uint8_t precision)
{
    if (!e.applied) {
        auto reason { e.discardReason.value_or("not applied") };
        if (e.overrideReason)
            reason += " (" + *e.overrideReason + ")";
        return reason;
    }
    std::string out;
    switch (e.type) {
    case ComponentType::Rate:
    case ComponentType::RatePP:
        out = e.rate.value_or(Decimal::zero()).canonical_string() + "% of " + e.baseSpec;
        break;
    case ComponentType::FixedUnit:
        out = e.fixed.value_or(Decimal::zero()).to_string(precision) + " per unit";
        break;
    case ComponentType::FixedOrder:
        out = e.fixed.value_or(Decimal::zero()).to_string(precision) + " per order";
        break;
    case ComponentType::Tier:
        out = "tiered by " + e.baseSpec + ", " + std::to_string(e.tierSelected.size()) + " bracket(s) selected";
        break;
    case ComponentType::Cap:
        if (e.capApplied) {
            out = "cap " + e.capApplied->bound;
            if (e.capApplied->limit)
                out += " " + e.capApplied->limit->to_string(precision);
            out += ", delta " + e.capApplied->delta.to_string(precision);
        }
        break;
    case ComponentType::Override:
        out = "override: " + e.overrideReason.value_or("");
        break;
    }
    if (e.capDelta)
        out += ", capped by " + e.capDelta->to_string(precision);
    return out;
}

std::string adjustment_signature(const LedgerEntry& original, const Adjustment& adj,
    const Decimal& amount, const Decimal& total)
{
    json lines(json::array());
    for (auto& l : adj.lineRefunds)
        lines.push_back({ { "line_id", l.lineId }, { "amount", l.amount.canonical_string() } });
    json payload {
        { "parent_entry_id", original.entryId ? original.entryId->value() : 0 },
        { "signature", original.signature },
        { "mode", to_string(adj.mode) },
        { "event_type", to_string(adj.eventType) },
        { "amount", amount.canonical_string() },
        { "line_refunds", std::move(lines) },
        { "total_fee", total.to_string(original.precision) }
    };
    return hashSHA256(payload.dump()).hex_string();
}

bool contains(const std::vector<std::string>& v, const std::string& s)
{
    return std::find(v.begin(), v.end(), s) != v.end();
}
}

Result<Adjustment> Adjustment::from_json(const json& j)
{
    try {
        JsonReader r(j, ERR_INVALID_ADJUSTMENT, "adjustment");
        Adjustment a;
        auto mode { parse_adjustment_mode(r.string_or("mode", "AUTO")) };
        if (!mode)
            r.fail("mode", "must be AUTO or MANUAL");
        a.mode = *mode;
        auto eventType { parse_event_type(r.string_or("event_type", "ADJUST")) };
        if (!eventType || *eventType == EventType::Settle)
            r.fail("event_type", "must be ADJUST, REFUND or CHARGEBACK");
        a.eventType = *eventType;
        a.amount = r.optional_decimal("amount");
        a.feeAmount = r.optional_decimal("fee_amount");
        a.currency = r.optional_string("currency");
        a.reason = r.string_or("reason", "");
        a.idempotencyKey = r.optional_string("idempotency_key");
        if (auto lrs { r.find("line_refunds") }) {
            if (!lrs->is_array())
                r.fail("line_refunds", "must be an array");
            for (auto& l : *lrs) {
                JsonReader lr(l, ERR_INVALID_ADJUSTMENT, "line_refunds");
                a.lineRefunds.push_back({ lr.string("line_id"), lr.decimal("amount") });
            }
        }
        return a;
    } catch (const ErrorMessage& e) {
        return e;
    }
}

std::vector<FeeSummaryItem> FeeLedger::fee_summary(const std::vector<BreakdownEntry>& breakdown, uint8_t precision)
{
    std::vector<FeeSummaryItem> out;
    out.reserve(breakdown.size());
    for (auto& e : breakdown) {
        out.push_back({
            .id = e.componentId,
            .name = e.componentName,
            .type = e.type,
            .amount = e.amount,
            .tags = e.tags,
            .details = details(e, precision),
        });
    }
    return out;
}

Result<SettleResult> FeeLedger::settle(const Transaction& tx)
{
    if (!callbacks.policies || !callbacks.store)
        return { MISSING_CALLBACK, "settle needs a policy loader and an entry store" };
    if (tx.channelKey.empty())
        return { MISSING_CHANNEL, "transaction has no channel_key" };

    const std::string asOf { tx.asOf.value_or(today_iso8601()) };
    auto policy { callbacks.policies->load_policy(tx.channelKey, asOf) };
    if (!policy)
        return { NO_POLICY, "no policy for channel \"" + tx.channelKey + "\" at " + asOf };

    auto calc { calculate(tx, *policy, options.calculation) };
    if (!calc)
        return calc.error();
    log_calculation("Calculated fee {} {} on channel {} with policy {} v{}, signature {}",
        calc->totalFee.to_string(), calc->currency, calc->channelKey,
        policy->policyKey, policy->version, calc->meta.signature);

    auto entry { make_settle_entry(*calc, *policy, asOf, tx.idempotencyKey, options.source) };
    try {
        if (entry.idempotencyKey) {
            for (auto& existing : callbacks.store->load_entries_by_transaction(entry.transactionId)) {
                if (existing.eventType != EventType::Settle || existing.idempotencyKey != entry.idempotencyKey)
                    continue;
                if (existing.signature != entry.signature)
                    return { ERR_IDEMPOTENCY_CONFLICT, "idempotency key \"" + *entry.idempotencyKey + "\" was used with a different calculation" };
                spdlog::info("Replaying settlement of transaction {} (idempotency key {})", entry.transactionId, *entry.idempotencyKey);
                auto fees { fee_summary(existing.breakdown, existing.precision) };
                return SettleResult { .entry = std::move(existing), .fees = std::move(fees), .replayed = true };
            }
        }
        entry.entryId = callbacks.store->save_entry(entry);
    } catch (const std::exception& e) {
        spdlog::error("Cannot persist settlement of transaction {}: {}", entry.transactionId, e.what());
        return { PERSIST_FAILED, e.what() };
    }
    spdlog::info("Settled transaction {} on channel {}: fee {} {} (entry {})",
        entry.transactionId, entry.channelKey, entry.totalFee.to_string(entry.precision),
        entry.currency, entry.entryId->value());
    auto fees { fee_summary(entry.breakdown, entry.precision) };
    return SettleResult { .entry = std::move(entry), .fees = std::move(fees) };
}

Result<Calculation> FeeLedger::simulate(const Transaction& tx, const Policy& policy) const
{
    return calculate(tx, policy, options.calculation);
}

Result<LineAllocation> FeeLedger::calculate_for_item(const LineInput& item, const Policy& policy) const
{
    Transaction tx;
    tx.channelKey = policy.channelKey;
    tx.lines.push_back(item);
    auto calc { calculate(tx, policy, options.calculation) };
    if (!calc)
        return calc.error();
    return std::move(calc->allocation.front());
}

Result<AdjustResult> FeeLedger::adjust(EntryId originalId, const Adjustment& adj)
{
    if (!callbacks.store)
        return { MISSING_CALLBACK, "adjust needs an entry store" };

    std::optional<LedgerEntry> original;
    try {
        original = callbacks.store->load_entry(originalId);
    } catch (const std::exception& e) {
        spdlog::error("Cannot load ledger entry {}: {}", originalId.value(), e.what());
        return { PERSIST_FAILED, e.what() };
    }
    if (!original)
        return { ERR_LEDGER_ENTRY_NOT_FOUND, "ledger entry " + std::to_string(originalId.value()) + " not found" };
    if (original->eventType != EventType::Settle)
        return { ERR_INVALID_ADJUSTMENT, "only SETTLE entries can be adjusted" };
    if (adj.eventType == EventType::Settle)
        return { ERR_INVALID_ADJUSTMENT, "adjustment cannot have event type SETTLE" };
    original->entryId = originalId;

    const bool strict { options.strict };
    if (strict && adj.currency && *adj.currency != original->currency)
        return { ERR_CURRENCY_MISMATCH, "adjustment currency " + *adj.currency + " differs from " + original->currency };

    auto& snapshot { original->inputSnapshot };
    Decimal lineRefundSum;
    for (auto& lr : adj.lineRefunds) {
        if (!contains(snapshot.lineIds, lr.lineId))
            return { ERR_LINE_NOT_FOUND, "line \"" + lr.lineId + "\" is not part of entry " + std::to_string(originalId.value()) };
        if (lr.amount.is_negative())
            return { ERR_INVALID_ADJUSTMENT, "line refund of \"" + lr.lineId + "\" is negative" };
        lineRefundSum += lr.amount;
    }
    AdjustmentCoverage coverage;
    if (!adj.lineRefunds.empty()) {
        for (auto& id : snapshot.lineIds) {
            bool affected { std::any_of(adj.lineRefunds.begin(), adj.lineRefunds.end(), [&](const LineRefund& lr) {
                return lr.lineId == id && lr.amount.is_positive();
            }) };
            (affected ? coverage.affectedLines : coverage.unaffectedLines).push_back(id);
        }
    }

    RefundComputation refund;
    Decimal amount;
    if (adj.mode == AdjustmentMode::Manual) {
        if (!adj.feeAmount)
            return { ERR_INVALID_ADJUSTMENT, "MANUAL adjustment needs fee_amount" };
        auto fee { adj.feeAmount->abs().round(original->precision) };
        if (strict && fee > original->totalFee.abs())
            return { ERR_EXCEEDS_ORIGINAL, "fee_amount " + fee.to_string() + " exceeds original fee " + original->totalFee.to_string(original->precision) };
        refund.total = -fee;
        amount = adj.amount.value_or(Decimal::zero());
    } else {
        if (adj.amount)
            amount = *adj.amount;
        else if (!adj.lineRefunds.empty())
            amount = lineRefundSum;
        else
            return { ERR_INVALID_ADJUSTMENT, "AUTO adjustment needs amount or line_refunds" };
        if (amount.is_negative())
            return { ERR_INVALID_ADJUSTMENT, "refund amount must not be negative" };
        if (strict && amount > snapshot.order.net)
            return { ERR_EXCEEDS_ORIGINAL, "refund amount " + amount.to_string() + " exceeds original order net " + snapshot.order.net.to_string() };
        auto r { compute_refund(*original, adj, amount) };
        if (!r)
            return r.error();
        refund = std::move(*r);
    }
    const auto signature { adjustment_signature(*original, adj, amount, refund.total) };

    try {
        auto entries { callbacks.store->load_entries_by_transaction(original->transactionId) };
        Decimal running;
        for (auto& e : entries)
            running += e.totalFee;

        if (adj.idempotencyKey) {
            for (auto& e : entries) {
                if (e.parentEntryId != originalId || e.idempotencyKey != adj.idempotencyKey)
                    continue;
                if (e.signature != signature)
                    return { ERR_IDEMPOTENCY_CONFLICT, "idempotency key \"" + *adj.idempotencyKey + "\" was used with a different adjustment" };
                spdlog::info("Replaying adjustment of entry {} (idempotency key {})", originalId.value(), *adj.idempotencyKey);
                AdjustResult res {
                    .feeAdjustment = e.totalFee,
                    .runningTotal = running,
                    .refundPlan = e.refundPlan,
                    .coverage = e.adjustment ? e.adjustment->coverage : AdjustmentCoverage {},
                    .replayed = true
                };
                res.entry = std::move(e);
                return res;
            }
        }

        running += refund.total;
        if (strict && !options.allowNegativeRunning && running.is_negative())
            return { ERR_EXCEEDS_ORIGINAL, "running total of transaction " + original->transactionId + " would drop to " + running.to_string(original->precision) };
        if (running.is_negative())
            spdlog::warn("Running total of transaction {} drops to {}", original->transactionId, running.to_string(original->precision));

        LedgerEntry entry;
        entry.transactionId = original->transactionId;
        entry.parentEntryId = originalId;
        entry.channelKey = original->channelKey;
        entry.asOf = today_iso8601();
        entry.eventType = adj.eventType;
        entry.currency = original->currency;
        entry.precision = original->precision;
        entry.totalFee = refund.total;
        entry.breakdown = std::move(refund.breakdown);
        entry.refundPlan = refund.plan;
        entry.policySnapshot = original->policySnapshot;
        entry.inputSnapshot = original->inputSnapshot;
        entry.adjustment = AdjustmentInfo { adj.mode, amount, adj.reason, coverage };
        entry.signature = signature;
        entry.idempotencyKey = adj.idempotencyKey;
        entry.source = original->source;
        entry.createdAt = now_iso8601();

        entry.entryId = callbacks.store->save_entry(entry);
        callbacks.store->update_entry(originalId, { .status = EntryStatus::Adjusted });
        spdlog::info("Adjusted entry {} of transaction {} ({}): fee {} {}, running total {}",
            originalId.value(), entry.transactionId, to_string(adj.mode),
            entry.totalFee.to_string(entry.precision), entry.currency, running.to_string(entry.precision));

        return AdjustResult {
            .entry = std::move(entry),
            .feeAdjustment = refund.total,
            .runningTotal = running,
            .refundPlan = std::move(refund.plan),
            .coverage = std::move(coverage),
        };
    } catch (const std::exception& e) {
        spdlog::error("Cannot persist adjustment of entry {}: {}", originalId.value(), e.what());
        return { PERSIST_FAILED, e.what() };
    }
}

Result<TransactionFees> FeeLedger::transaction_fees(const std::string& transactionId)
{
    if (!callbacks.store)
        return { MISSING_CALLBACK, "transaction_fees needs an entry store" };
    std::vector<LedgerEntry> entries;
    try {
        entries = callbacks.store->load_entries_by_transaction(transactionId);
    } catch (const std::exception& e) {
        spdlog::error("Cannot load entries of transaction {}: {}", transactionId, e.what());
        return { PERSIST_FAILED, e.what() };
    }

    TransactionFees out;
    out.transactionId = transactionId;
    if (!entries.empty())
        out.precision = entries.front().precision;
    out.entriesCount = entries.size();
    for (auto& e : entries) {
        const bool settle { e.eventType == EventType::Settle };
        (settle ? out.totalFees : out.totalAdjustments) += e.totalFee;
        for (auto& b : e.breakdown) {
            auto it { std::find_if(out.breakdown.begin(), out.breakdown.end(), [&](const ComponentTotal& t) {
                return t.componentId == b.componentId;
            }) };
            if (it == out.breakdown.end()) {
                out.breakdown.push_back({ .componentId = b.componentId });
                it = out.breakdown.end() - 1;
            }
            (settle ? it->settled : it->adjusted) += b.amount;
        }
    }
    out.netFees = out.totalFees + out.totalAdjustments;
    return out;
}

json TransactionFees::to_json() const
{
    json jb(json::array());
    for (auto& c : breakdown) {
        jb.push_back({
            { "component_id", c.componentId },
            { "settled", c.settled.to_string(precision) },
            { "adjusted", c.adjusted.to_string(precision) },
            { "net", c.net().to_string(precision) },
        });
    }
    return {
        { "transaction_id", transactionId },
        { "total_fees", totalFees.to_string(precision) },
        { "total_adjustments", totalAdjustments.to_string(precision) },
        { "net_fees", netFees.to_string(precision) },
        { "entries_count", entriesCount },
        { "breakdown", std::move(jb) }
    };
}

json to_json(const SettleResult& r)
{
    json fees(json::array());
    for (auto& f : r.fees) {
        fees.push_back({
            { "id", f.id },
            { "name", f.name },
            { "type", to_string(f.type) },
            { "amount", f.amount.to_string(r.entry.precision) },
            { "tags", f.tags },
            { "details", f.details },
        });
    }
    return {
        { "success", true },
        { "entry", r.entry.to_json() },
        { "fees", std::move(fees) },
        { "replayed", r.replayed }
    };
}

json to_json(const AdjustResult& r)
{
    auto precision { r.entry.precision };
    json plan(json::array());
    for (auto& p : r.refundPlan) {
        plan.push_back({
            { "component_id", p.componentId },
            { "original_amount", p.originalAmount.to_string(precision) },
            { "refund_amount", p.refundAmount.to_string(precision) },
            { "reason", p.reason },
        });
    }
    return {
        { "success", true },
        { "entry", r.entry.to_json() },
        { "fee_adjustment", r.feeAdjustment.to_string(precision) },
        { "running_total", r.runningTotal.to_string(precision) },
        { "refund_plan", std::move(plan) },
        { "coverage", {
                          { "affected_lines", r.coverage.affectedLines },
                          { "unaffected_lines", r.coverage.unaffectedLines },
                      } },
        { "replayed", r.replayed }
    };
}

#include "ledger/fee_ledger.hpp"
#include "ledger/memory_store.hpp"
#include "nlohmann/json.hpp"
#include <cassert>
#include <stdexcept>
using namespace std;
using nlohmann::json;

Decimal dec(std::string_view s)
{
    return Decimal::parse_throw(s);
}

class StaticPolicies : public PolicyLoader {
public:
    std::optional<Policy> load_policy(const std::string& channelKey, const std::string&) override
    {
        if (auto it { policies.find(channelKey) }; it != policies.end())
            return it->second;
        return {};
    }
    std::map<std::string, Policy> policies;
};

class FailingStore : public MemoryEntryStore {
public:
    EntryId save_entry(const LedgerEntry&) override
    {
        throw std::runtime_error("disk full");
    }
};

Transaction order(std::vector<std::pair<std::string, std::string>> lines, std::string id = "T-1")
{
    Transaction tx;
    tx.transactionId = std::move(id);
    tx.channelKey = "web";
    tx.asOf = "2024-03-01";
    for (auto& [lineId, net] : lines) {
        LineInput l;
        l.lineId = lineId;
        l.net = dec(net);
        tx.lines.push_back(std::move(l));
    }
    return tx;
}

Adjustment refund_of(std::string_view amount)
{
    Adjustment a;
    a.amount = dec(amount);
    a.reason = "customer return";
    return a;
}

Policy commission_with_processing()
{
    auto p { Policy::from_json(json::parse(R"({
        "policy_key": "web-fees",
        "channel_key": "web",
        "components": [
            { "component_id": "commission", "type": "RATE", "rate": "5" },
            { "component_id": "processing", "type": "FIXED_ORDER", "fixed": "10", "tags": ["non_refundable"] }
        ]
    })")) };
    assert(p.has_value());
    return *p;
}

struct Fixture {
    StaticPolicies policies;
    MemoryEntryStore store;
    Fixture(Policy p = make_simple_rate_policy("web", Decimal(5)))
    {
        policies.policies.emplace("web", std::move(p));
    }
    FeeLedger ledger(LedgerOptions options = {})
    {
        return FeeLedger({ .policies = &policies, .store = &store }, std::move(options));
    }
};

void test_settle_and_full_refund()
{
    Fixture f;
    auto ledger { f.ledger() };
    auto settled { ledger.settle(order({ { "L1", "1000" } })) };
    assert(settled.has_value());
    assert(!settled->replayed);
    auto& entry { settled->entry };
    assert(entry.entryId.has_value());
    assert(entry.eventType == EventType::Settle);
    assert(entry.status == EntryStatus::Active);
    assert(entry.totalFee == Decimal(50));
    assert(entry.asOf == "2024-03-01");
    assert(entry.policySnapshot.componentsCount == 1);
    assert(entry.inputSnapshot.lineIds == std::vector<std::string> { "L1" });
    assert(settled->fees.size() == 1);
    assert(settled->fees[0].id == "platform_fee");
    assert(settled->fees[0].details == "5% of net");

    auto adjusted { ledger.adjust(*entry.entryId, refund_of("1000")) };
    assert(adjusted.has_value());
    assert(adjusted->feeAdjustment == Decimal(-50));
    assert(adjusted->feeAdjustment.to_string(2) == "-50.00");
    assert(adjusted->runningTotal.is_zero());
    assert(adjusted->entry.eventType == EventType::Adjust);
    assert(adjusted->entry.parentEntryId == entry.entryId);
    assert(adjusted->entry.breakdown.at(0).amount == Decimal(-50));
    assert(adjusted->refundPlan.size() == 1);
    assert(adjusted->refundPlan[0].refundAmount == Decimal(50));
    assert(adjusted->refundPlan[0].reason == "proportional");
    assert(adjusted->entry.adjustment->reason == "customer return");

    assert(f.store.load_entry(*entry.entryId)->status == EntryStatus::Adjusted);
    assert(f.store.size() == 2);

    auto fees { ledger.transaction_fees("T-1") };
    assert(fees.has_value());
    assert(fees->entriesCount == 2);
    assert(fees->totalFees == Decimal(50));
    assert(fees->totalAdjustments == Decimal(-50));
    assert(fees->netFees.is_zero());
    assert(fees->breakdown.size() == 1);
    assert(fees->breakdown[0].net().is_zero());
    assert(fees->to_json()["net_fees"] == "0.00");
}

void test_non_refundable_tag()
{
    Fixture f(commission_with_processing());
    auto ledger { f.ledger() };
    auto settled { ledger.settle(order({ { "L1", "1000" } })) };
    assert(settled->entry.totalFee == Decimal(60));

    auto adjusted { ledger.adjust(*settled->entry.entryId, refund_of("500")) };
    assert(adjusted.has_value());
    assert(adjusted->feeAdjustment == Decimal(-25));
    assert(adjusted->runningTotal == Decimal(35));
    auto& plan { adjusted->refundPlan };
    assert(plan.size() == 2);
    assert(plan[0].componentId == "commission");
    assert(plan[0].refundAmount == dec("25.00"));
    assert(plan[1].componentId == "processing");
    assert(plan[1].refundAmount.is_zero());
    assert(plan[1].reason == "non_refundable_tag");
    assert(adjusted->entry.breakdown.size() == 2);
    assert(adjusted->entry.breakdown[1].amount.is_zero());
}

void test_line_refunds()
{
    Fixture f;
    auto ledger { f.ledger() };
    auto settled { ledger.settle(order({ { "L1", "600" }, { "L2", "400" } })) };
    Adjustment a;
    a.lineRefunds.push_back({ "L1", dec("600") });
    auto adjusted { ledger.adjust(*settled->entry.entryId, a) };
    assert(adjusted.has_value());
    assert(adjusted->feeAdjustment == Decimal(-30));
    assert(adjusted->coverage.affectedLines == std::vector<std::string> { "L1" });
    assert(adjusted->coverage.unaffectedLines == std::vector<std::string> { "L2" });

    Adjustment unknown;
    unknown.lineRefunds.push_back({ "L9", dec("1") });
    auto notFound { ledger.adjust(*settled->entry.entryId, unknown) };
    assert(!notFound && notFound.error().code == ERR_LINE_NOT_FOUND);

    Adjustment negative;
    negative.lineRefunds.push_back({ "L1", dec("-1") });
    auto invalid { ledger.adjust(*settled->entry.entryId, negative) };
    assert(!invalid && invalid.error().code == ERR_INVALID_ADJUSTMENT);
}

void test_manual_adjustment()
{
    Fixture f;
    auto ledger { f.ledger({ .strict = true }) };
    auto settled { ledger.settle(order({ { "L1", "1000" } })) };
    auto id { *settled->entry.entryId };

    Adjustment missing;
    missing.mode = AdjustmentMode::Manual;
    auto noFee { ledger.adjust(id, missing) };
    assert(!noFee && noFee.error().code == ERR_INVALID_ADJUSTMENT);

    Adjustment tooMuch;
    tooMuch.mode = AdjustmentMode::Manual;
    tooMuch.feeAmount = dec("100");
    auto exceeds { ledger.adjust(id, tooMuch) };
    assert(!exceeds && exceeds.error().code == ERR_EXCEEDS_ORIGINAL);

    Adjustment goodwill;
    goodwill.mode = AdjustmentMode::Manual;
    goodwill.feeAmount = dec("12.345");
    goodwill.reason = "goodwill";
    auto adjusted { ledger.adjust(id, goodwill) };
    assert(adjusted.has_value());
    assert(adjusted->feeAdjustment == dec("-12.35"));
    assert(adjusted->runningTotal == dec("37.65"));
    assert(adjusted->entry.adjustment->mode == AdjustmentMode::Manual);
    assert(adjusted->refundPlan.empty());
}

void test_strict_checks()
{
    Fixture f;
    auto ledger { f.ledger({ .strict = true }) };
    auto settled { ledger.settle(order({ { "L1", "1000" } })) };
    auto id { *settled->entry.entryId };

    auto exceeds { ledger.adjust(id, refund_of("2000")) };
    assert(!exceeds && exceeds.error().code == ERR_EXCEEDS_ORIGINAL);

    auto currency { refund_of("10") };
    currency.currency = "USD";
    auto mismatch { ledger.adjust(id, currency) };
    assert(!mismatch && mismatch.error().code == ERR_CURRENCY_MISMATCH);

    assert(ledger.adjust(id, refund_of("1000")).has_value());
    auto twice { ledger.adjust(id, refund_of("1000")) };
    assert(!twice && twice.error().code == ERR_EXCEEDS_ORIGINAL);
    assert(f.store.size() == 2);

    // the lenient ledger lets the running total go negative
    auto lenient { f.ledger() };
    auto negative { lenient.adjust(id, refund_of("1000")) };
    assert(negative.has_value());
    assert(negative->runningTotal == Decimal(-50));
}

void test_refund_behaviors()
{
    auto p { Policy::from_json(json::parse(R"({
        "policy_key": "web-behaviors",
        "channel_key": "web",
        "components": [
            { "component_id": "commission", "type": "RATE", "rate": "5",
              "refund": { "behavior": "FIXED_ONLY" } },
            { "component_id": "listing", "type": "FIXED_ORDER", "fixed": "10",
              "refund": { "behavior": "FIXED_ONLY" } },
            { "component_id": "setup", "type": "FIXED_ORDER", "fixed": "4",
              "refund": { "behavior": "NONE" } },
            { "component_id": "insurance", "type": "FIXED_ORDER", "fixed": "2",
              "refund": { "refundable": false } }
        ]
    })")) };
    assert(p.has_value());
    Fixture f(*p);
    auto ledger { f.ledger() };
    auto settled { ledger.settle(order({ { "L1", "1000" } })) };
    assert(settled->entry.totalFee == Decimal(66));

    auto adjusted { ledger.adjust(*settled->entry.entryId, refund_of("500")) };
    assert(adjusted.has_value());
    auto& plan { adjusted->refundPlan };
    assert(plan.size() == 4);
    assert(plan[0].reason == "fixed_only_skip");
    assert(plan[0].refundAmount.is_zero());
    assert(plan[1].reason == "proportional");
    assert(plan[1].refundAmount == Decimal(5));
    assert(plan[2].reason == "behavior_none");
    assert(plan[2].refundAmount.is_zero());
    assert(plan[3].reason == "not_refundable");
    assert(plan[3].refundAmount.is_zero());
    assert(adjusted->feeAdjustment == Decimal(-5));
    assert(adjusted->runningTotal == Decimal(61));

    // components excluded from refunds keep their settled amount
    auto fees { ledger.transaction_fees("T-1") };
    for (auto& c : fees->breakdown) {
        if (c.componentId == "setup")
            assert(c.net() == Decimal(4));
        if (c.componentId == "insurance")
            assert(c.net() == Decimal(2));
    }
}

void test_cap_refund_to_original()
{
    auto policy_with_cap = [](bool cap) {
        json j {
            { "policy_key", "web-over" },
            { "channel_key", "web" },
            { "components", json::array({ json {
                                { "component_id", "commission" },
                                { "type", "RATE" },
                                { "rate", "5" },
                                { "refund", { { "cap_refund_to_original", cap } } } } }) }
        };
        auto p { Policy::from_json(j) };
        assert(p.has_value());
        return *p;
    };

    // refund twice the order net on a lenient ledger
    Fixture capped(policy_with_cap(true));
    auto ledger { capped.ledger() };
    auto settled { ledger.settle(order({ { "L1", "1000" } })) };
    auto a { ledger.adjust(*settled->entry.entryId, refund_of("2000")) };
    assert(a.has_value());
    assert(a->refundPlan[0].reason == "capped_to_original");
    assert(a->refundPlan[0].refundAmount == Decimal(50));
    assert(a->feeAdjustment == Decimal(-50));
    assert(a->runningTotal.is_zero());

    Fixture uncapped(policy_with_cap(false));
    auto ledger2 { uncapped.ledger() };
    auto settled2 { ledger2.settle(order({ { "L1", "1000" } })) };
    auto b { ledger2.adjust(*settled2->entry.entryId, refund_of("2000")) };
    assert(b.has_value());
    assert(b->refundPlan[0].reason == "proportional");
    assert(b->refundPlan[0].refundAmount == Decimal(100));
    assert(b->feeAdjustment == Decimal(-100));
    assert(b->runningTotal == Decimal(-50));
}

void test_entry_without_breakdown()
{
    Fixture f;
    LedgerEntry legacy;
    legacy.transactionId = "T-legacy";
    legacy.channelKey = "web";
    legacy.asOf = "2023-12-01";
    legacy.currency = "CLP";
    legacy.totalFee = Decimal(40);
    legacy.inputSnapshot.linesCount = 1;
    legacy.inputSnapshot.lineIds = { "L1" };
    legacy.inputSnapshot.order.net = Decimal(1000);
    auto id { f.store.save_entry(legacy) };

    auto strict { f.ledger({ .strict = true }) };
    auto refused { strict.adjust(id, refund_of("500")) };
    assert(!refused && refused.error().code == ERR_NO_BREAKDOWN);

    // the lenient ledger refunds the entry total proportionally
    auto lenient { f.ledger() };
    auto adjusted { lenient.adjust(id, refund_of("500")) };
    assert(adjusted.has_value());
    assert(adjusted->feeAdjustment == Decimal(-20));
    assert(adjusted->runningTotal == Decimal(20));
    assert(adjusted->refundPlan.empty());
    assert(adjusted->entry.breakdown.empty());
}

void test_settle_idempotency()
{
    Fixture f;
    auto ledger { f.ledger() };
    auto tx { order({ { "L1", "1000" } }) };
    tx.idempotencyKey = "k1";
    auto first { ledger.settle(tx) };
    auto second { ledger.settle(tx) };
    assert(first.has_value() && second.has_value());
    assert(second->replayed);
    assert(second->entry.entryId == first->entry.entryId);
    assert(f.store.size() == 1);

    tx.lines[0].net = dec("2000");
    auto conflict { ledger.settle(tx) };
    assert(!conflict && conflict.error().code == ERR_IDEMPOTENCY_CONFLICT);
}

void test_adjust_idempotency()
{
    Fixture f;
    auto ledger { f.ledger() };
    auto settled { ledger.settle(order({ { "L1", "1000" } })) };
    auto id { *settled->entry.entryId };
    auto a { refund_of("100") };
    a.idempotencyKey = "r1";
    auto first { ledger.adjust(id, a) };
    auto second { ledger.adjust(id, a) };
    assert(first.has_value() && second.has_value());
    assert(second->replayed);
    assert(second->entry.entryId == first->entry.entryId);
    assert(second->feeAdjustment == Decimal(-5));
    assert(f.store.size() == 2);

    a.amount = dec("200");
    auto conflict { ledger.adjust(id, a) };
    assert(!conflict && conflict.error().code == ERR_IDEMPOTENCY_CONFLICT);
}

void test_errors()
{
    FeeLedger bare(LedgerCallbacks {});
    auto noCallbacks { bare.settle(order({ { "L1", "1" } })) };
    assert(!noCallbacks && noCallbacks.error().code == MISSING_CALLBACK);
    assert(bare.adjust(EntryId(1), refund_of("1")).error().code == MISSING_CALLBACK);

    Fixture f;
    auto ledger { f.ledger() };
    auto tx { order({ { "L1", "1" } }) };
    tx.channelKey = "";
    auto noChannel { ledger.settle(tx) };
    assert(!noChannel && noChannel.error().code == MISSING_CHANNEL);

    tx.channelKey = "pos";
    auto noPolicy { ledger.settle(tx) };
    assert(!noPolicy && noPolicy.error().code == NO_POLICY);

    auto notFound { ledger.adjust(EntryId(99), refund_of("1")) };
    assert(!notFound && notFound.error().code == ERR_LEDGER_ENTRY_NOT_FOUND);

    auto noLines { ledger.settle(order({})) };
    assert(!noLines && noLines.error().code == MISSING_LINES);

    // adjustments cannot be adjusted again
    auto settled { ledger.settle(order({ { "L1", "1000" } })) };
    auto adjusted { ledger.adjust(*settled->entry.entryId, refund_of("10")) };
    auto nested { ledger.adjust(*adjusted->entry.entryId, refund_of("10")) };
    assert(!nested && nested.error().code == ERR_INVALID_ADJUSTMENT);

    Adjustment empty;
    auto nothing { ledger.adjust(*settled->entry.entryId, empty) };
    assert(!nothing && nothing.error().code == ERR_INVALID_ADJUSTMENT);

    StaticPolicies policies;
    policies.policies.emplace("web", make_simple_rate_policy("web", Decimal(5)));
    FailingStore failing;
    FeeLedger broken({ .policies = &policies, .store = &failing });
    auto persist { broken.settle(order({ { "L1", "1000" } })) };
    assert(!persist && persist.error().code == PERSIST_FAILED);
    assert(persist.error().message == "disk full");
}

void test_simulate_and_item()
{
    Fixture f;
    auto ledger { f.ledger() };
    auto p { make_simple_rate_policy("web", Decimal(5)) };
    auto sim { ledger.simulate(order({ { "L1", "1000" } }), p) };
    assert(sim.has_value());
    assert(sim->totalFee == Decimal(50));
    assert(f.store.size() == 0);

    LineInput item;
    item.lineId = "SKU-1";
    item.net = dec("200");
    auto alloc { ledger.calculate_for_item(item, p) };
    assert(alloc.has_value());
    assert(alloc->lineId == "SKU-1");
    assert(alloc->feeAmount == Decimal(10));
}

void test_adjustment_json()
{
    auto a { Adjustment::from_json(json::parse(R"({
        "mode": "MANUAL", "event_type": "REFUND", "fee_amount": "5", "reason": "goodwill",
        "line_refunds": [ { "line_id": "L1", "amount": "20" } ]
    })")) };
    assert(a.has_value());
    assert(a->mode == AdjustmentMode::Manual);
    assert(a->eventType == EventType::Refund);
    assert(a->feeAmount == Decimal(5));
    assert(a->lineRefunds.size() == 1);

    auto settle { Adjustment::from_json(json { { "event_type", "SETTLE" } }) };
    assert(!settle && settle.error().code == ERR_INVALID_ADJUSTMENT);
    auto mode { Adjustment::from_json(json { { "mode", "SOMETIMES" } }) };
    assert(!mode && mode.error().code == ERR_INVALID_ADJUSTMENT);
    auto lineObject { Adjustment::from_json(json::parse(R"({ "line_refunds": { "L1": { "line_id": "L1", "amount": "20" } } })")) };
    assert(!lineObject && lineObject.error().code == ERR_INVALID_ADJUSTMENT);
}

int main()
{
    test_settle_and_full_refund();
    test_non_refundable_tag();
    test_line_refunds();
    test_manual_adjustment();
    test_strict_checks();
    test_refund_behaviors();
    test_cap_refund_to_original();
    test_entry_without_breakdown();
    test_settle_idempotency();
    test_adjust_idempotency();
    test_errors();
    test_simulate_and_item();
    test_adjustment_json();
    return 0;
}

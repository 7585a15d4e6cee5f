#include "engine/calculator.hpp"
#include "nlohmann/json.hpp"
#include <cassert>
#include <iostream>
using namespace std;
using nlohmann::json;

Decimal dec(std::string_view s)
{
    return Decimal::parse_throw(s);
}

LineInput line(std::string id, std::string_view net, std::string_view quantity = "1")
{
    LineInput l;
    l.lineId = std::move(id);
    l.net = dec(net);
    l.quantity = dec(quantity);
    return l;
}

Transaction order(std::vector<LineInput> lines)
{
    Transaction tx;
    tx.transactionId = "T-1";
    tx.channelKey = "web";
    tx.lines = std::move(lines);
    return tx;
}

Policy policy(json components)
{
    json j {
        { "policy_key", "test" },
        { "channel_key", "web" },
        { "components", std::move(components) }
    };
    auto p { Policy::from_json(j) };
    if (!p)
        cerr << p.error().message << endl;
    assert(p.has_value());
    return *p;
}

bool has_warning(const Calculation& c, const std::string& code)
{
    for (auto& w : c.warnings) {
        if (w.code == code)
            return true;
    }
    return false;
}

void test_simple_rate()
{
    auto calc { calculate(order({ line("L1", "1000.00") }), make_simple_rate_policy("web", Decimal(5))) };
    assert(calc.has_value());
    assert(calc->totalFee == Decimal(50));
    assert(calc->totalFee.to_string(calc->precision) == "50.00");
    auto& e { calc->breakdown.at(0) };
    assert(e.componentId == "platform_fee");
    assert(e.applied);
    assert(e.baseUsed == Decimal(1000));
    assert(e.rate == Decimal(5));
    assert(calc->allocation.size() == 1);
    assert(calc->allocation[0].feeAmount == Decimal(50));
    assert(calc->reconciliation.balanced);
    assert(calc->currency == "CLP");
    assert(calc->meta.policyKey == make_simple_rate_policy("web", Decimal(5)).policyKey);
}

void test_cap_max()
{
    auto p { policy(json::parse(R"([
        { "component_id": "platform_fee", "type": "RATE", "rate": "5" },
        { "component_id": "fee_cap", "type": "CAP", "precedence": 900, "max": "30" }
    ])")) };
    auto calc { calculate(order({ line("L1", "1000.00") }), p) };
    assert(calc.has_value());
    assert(calc->totalFee == Decimal(30));

    auto rate { calc->find("platform_fee") };
    assert(rate->amount == Decimal(30));
    assert(rate->capDelta == Decimal(20));

    auto cap { calc->find("fee_cap") };
    assert(cap->amount.is_zero());
    assert(cap->capApplied.has_value());
    assert(cap->capApplied->bound == "max");
    assert(cap->capApplied->limit == Decimal(30));
    assert(cap->capApplied->targetSumBefore == Decimal(50));
    assert(cap->capApplied->delta == Decimal(20));
    assert(cap->capApplied->targetsMatched == std::vector<std::string> { "platform_fee" });
    assert(calc->explain.capTargeting.size() == 1);
    assert(calc->allocation[0].feeAmount == Decimal(30));
    assert(calc->reconciliation.balanced);
}

void test_cap_min_and_targets()
{
    auto p { policy(json::parse(R"([
        { "component_id": "commission", "type": "RATE", "rate": "1", "tags": ["core"] },
        { "component_id": "handling", "type": "FIXED_ORDER", "fixed": "2" },
        { "component_id": "floor", "type": "CAP", "precedence": 900, "min": "5",
          "targets": { "tags_any": ["core"] } }
    ])")) };
    auto calc { calculate(order({ line("L1", "100") }), p) };
    assert(calc.has_value());
    // commission 1.00 is raised to the 5.00 floor, handling is untouched
    assert(calc->find("commission")->amount == Decimal(5));
    assert(calc->find("commission")->capDelta == Decimal(-4));
    assert(calc->find("handling")->amount == Decimal(2));
    assert(calc->find("floor")->capApplied->bound == "min");
    assert(calc->totalFee == Decimal(7));

    auto none { policy(json::parse(R"([
        { "component_id": "commission", "type": "RATE", "rate": "1" },
        { "component_id": "cap", "type": "CAP", "precedence": 900, "max": "5",
          "targets": { "component_ids": ["missing"] } }
    ])")) };
    auto c2 { calculate(order({ line("L1", "100") }), none) };
    assert(c2.has_value());
    assert(has_warning(*c2, "CAP_NO_TARGETS"));
    assert(!c2->find("cap")->applied);
    assert(c2->totalFee == Decimal(1));
}

void test_allocation_by_net()
{
    auto calc { calculate(order({ line("L1", "600"), line("L2", "400") }), make_simple_rate_policy("web", Decimal(5))) };
    assert(calc.has_value());
    assert(calc->totalFee == Decimal(50));
    assert(calc->line("L1")->feeAmount == Decimal(30));
    assert(calc->line("L2")->feeAmount == Decimal(20));
    assert(calc->line("L1")->components.at(0).weight == dec("0.6"));
    assert(calc->reconciliation.allocatedSum == Decimal(50));
    assert(calc->reconciliation.difference.is_zero());
}

void test_allocation_remainder()
{
    auto p { policy(json::parse(R"([
        { "component_id": "handling", "type": "FIXED_ORDER", "fixed": "10", "proration_method": "EQUAL" }
    ])")) };
    auto calc { calculate(order({ line("A", "1"), line("B", "1"), line("C", "1") }), p) };
    assert(calc.has_value());
    assert(calc->line("A")->feeAmount == dec("3.33"));
    assert(calc->line("B")->feeAmount == dec("3.33"));
    assert(calc->line("C")->feeAmount == dec("3.34"));
    assert(calc->reconciliation.balanced);
}

void test_zero_weight_fallback()
{
    auto p { policy(json::parse(R"([
        { "component_id": "handling", "type": "FIXED_ORDER", "fixed": "4", "proration_method": "BY_QUANTITY" }
    ])")) };
    auto calc { calculate(order({ line("A", "10", "0"), line("B", "10", "0") }), p) };
    assert(calc.has_value());
    assert(has_warning(*calc, "ZERO_WEIGHT_FALLBACK"));
    assert(calc->line("A")->feeAmount == Decimal(2));
    assert(calc->line("B")->feeAmount == Decimal(2));
    assert(calc->line("A")->components[0].proration == ProrationMethod::Equal);
}

void test_signature_determinism()
{
    auto p { make_simple_rate_policy("web", Decimal(5)) };
    auto tx { order({ line("L1", "600"), line("L2", "400") }) };
    auto a { calculate(tx, p) };
    auto b { calculate(tx, p) };
    assert(a->meta.signature.size() == 64);
    assert(a->meta.signature == b->meta.signature);
    assert(a->to_json() == b->to_json());

    tx.context["segment"] = "vip";
    auto c { calculate(tx, p) };
    assert(c->meta.signature != a->meta.signature);

    auto other { make_simple_rate_policy("web", Decimal(6)) };
    auto d { calculate(order({ line("L1", "600"), line("L2", "400") }), other) };
    assert(d->meta.policyHash != a->meta.policyHash);
    assert(d->meta.signature != a->meta.signature);
}

void test_tiers()
{
    auto p { make_tiered_policy("web", {
                                           TierBracket { .min = Decimal(0), .max = Decimal(100), .rate = Decimal(10) },
                                           TierBracket { .min = dec("100.01"), .rate = Decimal(5) },
                                       }) };
    auto calc { calculate(order({ line("cheap", "50"), line("pricey", "200") }), p) };
    assert(calc.has_value());
    auto e { calc->find("tiered_fee") };
    assert(e->tierSelected.size() == 2);
    assert(e->tierSelected[0].lineId == "cheap");
    assert(e->amount == Decimal(15));

    // boundary value 100 falls in the first bracket
    auto edge { calculate(order({ line("L1", "100") }), p) };
    assert(edge->totalFee == Decimal(10));
}

void test_tier_no_match()
{
    auto p { make_tiered_policy("web", { TierBracket { .min = Decimal(0), .max = Decimal(100), .rate = Decimal(10) } }) };
    auto calc { calculate(order({ line("L1", "500") }), p) };
    assert(calc.has_value());
    assert(has_warning(*calc, "NO_TIER_MATCH"));
    auto e { calc->find("tiered_fee") };
    assert(!e->applied);
    assert(e->discardReason == "no_tier_match");
    assert(calc->totalFee.is_zero());
    assert(calc->explain.componentsDiscarded.size() == 1);
}

void test_tier_fixed_per_unit()
{
    auto p { make_tiered_policy("web", { TierBracket { .min = Decimal(0), .fixed = dec("1.5") } }) };
    auto calc { calculate(order({ line("L1", "30", "3") }), p) };
    assert(calc.has_value());
    assert(calc->totalFee == dec("4.5"));

    // order scope charges fixed per unit of the whole order
    auto orderTier { policy(json::parse(R"([
        { "component_id": "order_tier", "type": "TIER", "scope": "order",
          "tiers": [ { "min": 0, "max": 100, "fixed": "2" }, { "min": "100.01", "rate": "1", "fixed": "0.5" } ] }
    ])")) };
    auto o { calculate(order({ line("A", "60", "2"), line("B", "90", "3") }), orderTier) };
    assert(o.has_value());
    // 1% of 150 plus 0.50 for each of the 5 units
    assert(o->totalFee == Decimal(4));
    assert(o->find("order_tier")->tierSelected.size() == 1);
}

void test_tier_closed_open()
{
    json j {
        { "policy_key", "test" },
        { "channel_key", "web" },
        { "tier_boundary", "closed_open" },
        { "components", json::parse(R"([
            { "component_id": "tiered", "type": "TIER",
              "tiers": [ { "min": 0, "max": 100, "rate": "10" }, { "min": 100, "rate": "5" } ] }
        ])") }
    };
    auto closedOpen { Policy::from_json(j) };
    assert(closedOpen.has_value());
    assert(closedOpen->tierBoundary == TierBoundary::ClosedOpen);
    auto calc { calculate(order({ line("L1", "100") }), *closedOpen) };
    assert(calc->totalFee == Decimal(5));

    j["tier_boundary"] = "closed_closed";
    auto closed { Policy::from_json(j) };
    auto again { calculate(order({ line("L1", "100") }), *closed) };
    assert(again->totalFee == Decimal(10));
}

void test_rate_pp_and_fixed_unit()
{
    auto p { policy(json::parse(R"([
        { "component_id": "pp", "type": "RATE_PP", "pp": "2.5" },
        { "component_id": "per_unit", "type": "FIXED_UNIT", "fixed": "0.75" }
    ])")) };
    auto calc { calculate(order({ line("A", "200", "2"), line("B", "100", "3") }), p) };
    assert(calc.has_value());
    auto pp { calc->find("pp") };
    assert(pp->amount == dec("7.5"));
    assert(pp->baseUsed == Decimal(300));
    auto unit { calc->find("per_unit") };
    assert(unit->amount == dec("3.75"));
    assert(unit->baseUsed == Decimal(5));
    assert(calc->totalFee == dec("11.25"));
    assert(calc->reconciliation.balanced);
}

void test_cap_redistribution()
{
    // the cap delta is split by target amount, the remainder goes to the last target
    auto p { policy(json::parse(R"([
        { "component_id": "commission", "type": "RATE", "rate": "5" },
        { "component_id": "listing", "type": "FIXED_ORDER", "fixed": "20" },
        { "component_id": "cap", "type": "CAP", "precedence": 900, "max": "60" }
    ])")) };
    auto calc { calculate(order({ line("L1", "1000") }), p) };
    assert(calc.has_value());
    auto commission { calc->find("commission") };
    auto listing { calc->find("listing") };
    assert(commission->capDelta == dec("7.14"));
    assert(commission->amount == dec("42.86"));
    assert(listing->capDelta == dec("2.86"));
    assert(listing->amount == dec("17.14"));
    auto cap { calc->find("cap") };
    assert(cap->amount.is_zero());
    assert(cap->capApplied->delta == Decimal(10));
    assert(cap->capApplied->targetsMatched == (std::vector<std::string> { "commission", "listing" }));
    assert(calc->totalFee == Decimal(60));
}

void test_override()
{
    auto p { policy(json::parse(R"([
        { "component_id": "commission", "type": "RATE", "rate": "5", "tags": ["promo"] },
        { "component_id": "handling", "type": "FIXED_ORDER", "fixed": "2" },
        { "component_id": "promo_week", "type": "OVERRIDE", "precedence": 500,
          "exclude_tags": ["promo"], "reason": "promo week", "replacement": "1" }
    ])")) };
    auto calc { calculate(order({ line("L1", "1000") }), p) };
    assert(calc.has_value());
    auto commission { calc->find("commission") };
    assert(!commission->applied);
    assert(commission->amount.is_zero());
    assert(commission->discardReason == "override_excluded");
    assert(commission->overrideReason == "promo week");
    assert(calc->find("handling")->applied);
    assert(calc->find("promo_week")->amount == Decimal(1));
    assert(calc->totalFee == Decimal(3));
    assert(calc->reconciliation.balanced);
}

void test_conditions()
{
    auto p { policy(json::parse(R"([
        { "component_id": "big_order", "type": "RATE", "rate": "5",
          "conditions": [ { "field": "order.net", "operator": "gte", "value": 500 } ] },
        { "component_id": "vip", "type": "FIXED_ORDER", "fixed": "1",
          "conditions": [ { "field": "context.segment", "op": "eq", "value": "vip" } ] }
    ])")) };
    auto small { calculate(order({ line("L1", "400") }), p) };
    assert(small->totalFee.is_zero());
    assert(small->find("big_order")->discardReason == "condition_not_met");

    auto tx { order({ line("L1", "600") }) };
    tx.context["segment"] = "vip";
    auto big { calculate(tx, p) };
    assert(big->find("big_order")->amount == Decimal(30));
    assert(big->find("vip")->amount == Decimal(1));
    assert(big->totalFee == Decimal(31));
}

void test_line_selector()
{
    auto p { policy(json::parse(R"([
        { "component_id": "books", "type": "RATE", "rate": "10",
          "line_selector": { "where": [ { "field": "category", "operator": "eq", "value": "books" } ] } }
    ])")) };
    auto book { line("B", "100") };
    book.category = "books";
    auto toy { line("T", "300") };
    toy.category = "toys";
    auto calc { calculate(order({ book, toy }), p) };
    assert(calc.has_value());
    auto e { calc->find("books") };
    assert(e->amount == Decimal(10));
    assert(e->appliedLineIds == std::vector<std::string> { "B" });
    assert(e->excludedLineCount == 1);
    assert(calc->line("T")->feeAmount.is_zero());
    assert(calc->explain.lineCoverage.at("books").excluded == std::vector<std::string> { "T" });

    auto strictSel { policy(json::parse(R"([
        { "component_id": "music", "type": "RATE", "rate": "10",
          "line_selector": { "where": [ { "field": "category", "operator": "eq", "value": "music" } ], "require_match": true } }
    ])")) };
    auto failed { calculate(order({ book }), strictSel) };
    assert(!failed && failed.error().code == LINE_SELECTOR_NO_MATCH);
}

void test_custom_base_fields()
{
    auto p { policy(json::parse(R"([
        { "component_id": "commission", "type": "RATE", "rate": "5", "base_spec": "commissionable" }
    ])")) };
    auto missing { calculate(order({ line("L1", "100") }), p) };
    assert(!missing);
    assert(missing.error().code == MISSING_BASE_FIELD);

    auto a { line("A", "100") };
    a.amounts["commissionable"] = Decimal(80);
    auto calc { calculate(order({ a, line("B", "100") }), p) };
    assert(calc.has_value());
    assert(calc->totalFee == Decimal(4));
    assert(calc->line("A")->feeAmount == Decimal(4));
}

void test_structural_errors()
{
    auto p { make_simple_rate_policy("web", Decimal(5)) };
    auto empty { calculate(order({}), p) };
    assert(!empty && empty.error().code == MISSING_LINES);

    LineInput noAmount;
    noAmount.lineId = "X";
    auto invalid { calculate(order({ noAmount }), p) };
    assert(!invalid && invalid.error().code == INVALID_LINE);

    auto dup { calculate(order({ line("X", "1"), line("X", "2") }), p) };
    assert(!dup && dup.error().code == INVALID_LINE);
}

void test_options()
{
    auto p { make_simple_rate_policy("web", Decimal(5)) };
    auto tx { order({ line("L1", "999") }) };
    auto cents { calculate(tx, p) };
    assert(cents->totalFee == dec("49.95"));
    auto whole { calculate(tx, p, { .precision = 0 }) };
    assert(whole->totalFee == Decimal(50));
    assert(whole->precision == 0);
}

void test_gross_with_tax_rate()
{
    LineInput l;
    l.lineId = "L1";
    l.gross = dec("119");
    l.taxRate = dec("19");
    auto calc { calculate(order({ l }), make_simple_rate_policy("web", Decimal(10))) };
    assert(calc.has_value());
    assert(calc->input.lines[0].net == Decimal(100));
    assert(calc->totalFee == Decimal(10));
}

int main()
{
    test_simple_rate();
    test_cap_max();
    test_cap_min_and_targets();
    test_allocation_by_net();
    test_allocation_remainder();
    test_zero_weight_fallback();
    test_signature_determinism();
    test_tiers();
    test_tier_no_match();
    test_tier_fixed_per_unit();
    test_tier_closed_open();
    test_rate_pp_and_fixed_unit();
    test_cap_redistribution();
    test_override();
    test_conditions();
    test_line_selector();
    test_custom_base_fields();
    test_structural_errors();
    test_options();
    test_gross_with_tax_rate();
    return 0;
}

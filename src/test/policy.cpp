#include "nlohmann/json.hpp"
#include "policy/policy.hpp"
#include <cassert>
using namespace std;
using nlohmann::json;

json marketplace_policy()
{
    return json::parse(R"({
        "policy_key": "marketplace",
        "version": 3,
        "channel_key": "web",
        "currency": "USD",
        "precision": 2,
        "components": [
            { "component_id": "cap", "type": "CAP", "precedence": 900, "max": "30",
              "targets": { "component_ids": ["commission"] } },
            { "component_id": "commission", "type": "RATE", "rate": "5", "tags": ["core", "commission"],
              "refund": { "refundable": true, "behavior": "PROPORTIONAL" } },
            { "component_id": "handling", "type": "FIXED_ORDER", "fixed": 2, "precedence": 100,
              "refund": { "refundable": false } },
            { "component_id": "by_price", "type": "TIER", "tier_by": "unit_price",
              "tiers": [ { "min": 0, "max": 100, "rate": "2" }, { "min": "100.01", "fixed": "1.5" } ] }
        ]
    })");
}

void test_from_json()
{
    auto p { Policy::from_json(marketplace_policy()) };
    assert(p.has_value());
    assert(p->policyKey == "marketplace");
    assert(p->version == 3);
    assert(p->currency == "USD");
    assert(p->effectiveFrom == "1970-01-01");
    assert(p->effectiveTo == "9999-12-31");
    assert(p->components.size() == 4);

    auto cap { p->find("cap") };
    assert(cap && cap->type() == ComponentType::Cap);
    assert(cap->scope == Scope::Order);
    auto& capRule { std::get<rule::Cap>(cap->rule) };
    assert(capRule.max == Decimal(30));
    assert(!capRule.min);
    assert(capRule.targets->componentIds == std::vector<std::string> { "commission" });

    auto commission { p->find("commission") };
    assert(commission->scope == Scope::Line);
    assert(commission->has_tag("core"));
    assert(std::get<rule::Rate>(commission->rule).rate == Decimal(5));

    auto handling { p->find("handling") };
    assert(handling->refund.refundable == false);

    auto tier { p->find("by_price") };
    auto& t { std::get<rule::Tier>(tier->rule) };
    assert(t.tiers.size() == 2);
    assert(!t.tiers[1].max);
    assert(t.tiers[0].contains(Decimal(100), TierBoundary::ClosedClosed));
    assert(!t.tiers[0].contains(Decimal(100), TierBoundary::ClosedOpen));
}

void test_evaluation_order()
{
    auto p { Policy::from_json(marketplace_policy()) };
    auto order { p->evaluation_order() };
    assert(order.size() == 4);
    // ties keep declaration order
    assert(order[0]->id == "commission");
    assert(order[1]->id == "handling");
    assert(order[2]->id == "by_price");
    assert(order[3]->id == "cap");
}

void test_validation()
{
    json j(marketplace_policy());
    j["components"][1]["component_id"] = "cap";
    auto dup { Policy::from_json(j) };
    assert(!dup && dup.error().code == INVALID_COMPONENT);

    j = marketplace_policy();
    j["components"][0]["min"] = "40";
    auto bounds { Policy::from_json(j) };
    assert(!bounds && bounds.error().code == CAP_INVALID_BOUNDS);

    j = marketplace_policy();
    j["components"][1]["type"] = "PERCENT";
    auto type { Policy::from_json(j) };
    assert(!type && type.error().code == INVALID_COMPONENT);

    j = marketplace_policy();
    j["components"][1]["rate"] = 0.05;
    auto floating { Policy::from_json(j) };
    assert(!floating);

    j = marketplace_policy();
    j["precision"] = 19;
    auto precision { Policy::from_json(j) };
    assert(!precision && precision.error().code == INVALID_POLICY);

    j = marketplace_policy();
    j["components"][3]["tiers"] = json::array();
    auto tiers { Policy::from_json(j) };
    assert(!tiers && tiers.error().code == INVALID_COMPONENT);

    auto noKey { Policy::from_json(json::object()) };
    assert(!noKey && noKey.error().code == INVALID_POLICY);
}

void test_hash()
{
    auto a { Policy::from_json(marketplace_policy()) };
    auto b { Policy::from_json(marketplace_policy()) };
    assert(a->hash() == b->hash());
    assert(a->hash().starts_with("v2:"));
    assert(a->hash().size() == 3 + 16);

    // effective dating does not change the hash
    b->effectiveFrom = "2024-01-01";
    b->active = false;
    assert(a->hash() == b->hash());

    // equal decimals hash equally
    json j(marketplace_policy());
    j["components"][1]["rate"] = "5.000";
    auto c { Policy::from_json(j) };
    assert(a->hash() == c->hash());

    j["components"][1]["rate"] = "5.5";
    auto d { Policy::from_json(j) };
    assert(a->hash() != d->hash());
}

void test_round_trip()
{
    auto a { Policy::from_json(marketplace_policy()) };
    auto b { Policy::from_json(a->to_json()) };
    assert(b.has_value());
    assert(a->hash() == b->hash());
    assert(b->components.size() == a->components.size());
}

void test_builders()
{
    auto simple { make_simple_rate_policy("pos", Decimal(3)) };
    assert(simple.validate().has_value());
    assert(simple.components.size() == 1);
    assert(simple.components[0].id == "platform_fee");
    assert(simple.channelKey == "pos");

    auto tiered { make_tiered_policy("pos", { TierBracket { .min = Decimal(0), .max = Decimal(10), .fixed = Decimal(1) } }) };
    assert(tiered.validate().has_value());
    assert(tiered.components[0].id == "tiered_fee");
    assert(std::get<rule::Tier>(tiered.components[0].rule).tierBy == "unit_price");
}

int main()
{
    test_from_json();
    test_evaluation_order();
    test_validation();
    test_hash();
    test_round_trip();
    test_builders();
    return 0;
}

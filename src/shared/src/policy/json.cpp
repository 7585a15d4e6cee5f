#include "json_reader.hpp"
#include "policy.hpp"
#include <limits>

using nlohmann::json;

namespace {
Condition parse_condition(const json& j, const std::string& ctx)
{
    JsonReader r(j, INVALID_CONDITION, ctx);
    Condition c;
    c.field = r.string("field");
    auto opName { r.string_or("operator", r.string_or("op", "eq")) };
    auto op { parse_operator(opName) };
    if (!op)
        r.fail("unknown operator \"" + opName + "\"");
    c.op = *op;
    if (auto v { r.find("value") })
        c.value = JsonReader::to_field_value(*v);
    return c;
}

std::vector<Condition> parse_conditions(const json* j, const std::string& ctx)
{
    std::vector<Condition> out;
    if (!j)
        return out;
    if (!j->is_array())
        throw ErrorMessage(INVALID_CONDITION, ctx + ": conditions must be an array");
    for (auto& c : *j)
        out.push_back(parse_condition(c, ctx));
    return out;
}

LineSelector parse_line_selector(const json& j, const std::string& ctx)
{
    JsonReader r(j, INVALID_LINE_SELECTOR, ctx);
    LineSelector s;
    s.where = parse_conditions(r.find("where"), ctx);
    if (auto anyOf { r.find("any_of") }) {
        if (!anyOf->is_array())
            r.fail("any_of", "must be an array of condition groups");
        for (auto& g : *anyOf) {
            if (g.is_object())
                s.anyOf.push_back({ parse_condition(g, ctx) });
            else
                s.anyOf.push_back(parse_conditions(&g, ctx));
        }
    }
    auto mode { r.string_or("mode", "include") };
    auto m { parse_selector_mode(mode) };
    if (!m)
        r.fail("mode", "must be include or exclude");
    s.mode = *m;
    s.requireMatch = r.boolean_or("require_match", false);
    return s;
}

TierBracket parse_tier(const json& j, const std::string& ctx)
{
    JsonReader r(j, INVALID_COMPONENT, ctx);
    return TierBracket {
        .min = r.decimal_or("min", Decimal::zero()),
        .max = r.optional_decimal("max"),
        .rate = r.optional_decimal("rate"),
        .fixed = r.optional_decimal("fixed")
    };
}

CapTargets parse_targets(const json& j, const std::string& ctx)
{
    JsonReader r(j, INVALID_COMPONENT, ctx);
    CapTargets t;
    t.componentIds = r.strings("component_ids");
    t.tagsAny = r.strings("tags_any");
    for (auto& s : r.strings("types")) {
        auto ty { parse_component_type(s) };
        if (!ty)
            r.fail("types", "contains unknown type \"" + s + "\"");
        t.types.push_back(*ty);
    }
    for (auto& s : r.strings("scopes")) {
        auto sc { parse_scope(s) };
        if (!sc)
            r.fail("scopes", "contains unknown scope \"" + s + "\"");
        t.scopes.push_back(*sc);
    }
    return t;
}

Rule parse_rule(ComponentType type, const JsonReader& r)
{
    switch (type) {
    case ComponentType::Rate:
        return rule::Rate { r.decimal("rate") };
    case ComponentType::RatePP:
        return rule::RatePP { r.has("pp") ? r.decimal("pp") : r.decimal("rate") };
    case ComponentType::FixedUnit:
        return rule::FixedUnit { r.decimal("fixed") };
    case ComponentType::FixedOrder:
        return rule::FixedOrder { r.decimal("fixed") };
    case ComponentType::Tier: {
        rule::Tier t;
        t.tierBy = r.optional_string("tier_by");
        auto tiers { r.find("tiers") };
        if (!tiers || !tiers->is_array())
            r.fail("tiers", "must be an array");
        for (auto& b : *tiers)
            t.tiers.push_back(parse_tier(b, r.context));
        return t;
    }
    case ComponentType::Cap: {
        rule::Cap c;
        c.min = r.optional_decimal("min");
        c.max = r.optional_decimal("max");
        if (auto t { r.find("targets") })
            c.targets = parse_targets(*t, r.context);
        return c;
    }
    case ComponentType::Override: {
        rule::Override o;
        o.excludes = r.strings("excludes");
        o.excludeTags = r.strings("exclude_tags");
        o.reason = r.string_or("reason", "");
        o.replacement = r.optional_decimal("replacement");
        return o;
    }
    }
    r.fail("type", "is unknown");
}

Component parse_component(const json& j, size_t index)
{
    JsonReader r(j, INVALID_COMPONENT, "component #" + std::to_string(index + 1));
    Component c;
    c.id = r.string("component_id");
    const std::string ctx { "component \"" + c.id + "\"" };
    JsonReader cr(j, INVALID_COMPONENT, ctx);
    c.name = cr.string_or("name", c.id);

    auto typeName { cr.string("type") };
    auto type { parse_component_type(typeName) };
    if (!type)
        cr.fail("invalid component type \"" + typeName + "\"");
    c.rule = parse_rule(*type, cr);

    c.scope = Component::default_scope(*type);
    if (auto s { cr.optional_string("scope") }) {
        auto sc { parse_scope(*s) };
        if (!sc)
            cr.fail("scope", "must be order or line");
        c.scope = *sc;
    }
    c.precedence = int32_t(cr.integer_or("precedence", 100));
    if (auto b { cr.find("base_spec") }) {
        auto base { BaseSpec::from_json(*b) };
        if (!base)
            throw ErrorMessage(base.error().code, ctx + ": " + base.error().message);
        c.base = std::move(*base);
    }
    for (auto& t : cr.strings("tags"))
        c.tags.insert(t);
    c.conditions = parse_conditions(cr.find("conditions"), ctx);
    if (auto s { cr.find("line_selector") })
        c.lineSelector = parse_line_selector(*s, ctx);
    if (auto p { cr.optional_string("proration_method") }) {
        auto m { parse_proration_method(*p) };
        if (!m)
            cr.fail("proration_method", "is unknown");
        c.proration = *m;
    }
    if (auto rf { cr.find("refund") }) {
        JsonReader rr(*rf, INVALID_COMPONENT, ctx + " refund");
        c.refund.refundable = rr.boolean_or("refundable", true);
        auto behavior { parse_refund_behavior(rr.string_or("behavior", "PROPORTIONAL")) };
        if (!behavior)
            rr.fail("behavior", "must be PROPORTIONAL, FIXED_ONLY or NONE");
        c.refund.behavior = *behavior;
        c.refund.capRefundToOriginal = rr.boolean_or("cap_refund_to_original", true);
    }
    return c;
}

json decimal_json(const std::optional<Decimal>& d)
{
    if (!d)
        return nullptr;
    return d->canonical_string();
}

json condition_json(const Condition& c)
{
    json v;
    std::visit(overloaded {
                   [&](const std::monostate&) { v = nullptr; },
                   [&](const Decimal& d) { v = d.canonical_string(); },
                   [&](const std::string& s) { v = s; },
                   [&](const std::vector<std::string>& l) { v = l; } },
        c.value);
    return json {
        { "field", c.field },
        { "operator", to_string(c.op) },
        { "value", v }
    };
}

json conditions_json(const std::vector<Condition>& conditions)
{
    json arr = json::array();
    for (auto& c : conditions)
        arr.push_back(condition_json(c));
    return arr;
}

json component_json(const Component& c)
{
    json j;
    j["component_id"] = c.id;
    j["name"] = c.name;
    j["type"] = to_string(c.type());
    j["scope"] = to_string(c.scope);
    j["precedence"] = c.precedence;
    j["base_spec"] = c.base.to_json();
    j["tags"] = c.tags;
    j["conditions"] = conditions_json(c.conditions);
    if (c.lineSelector) {
        auto& s { *c.lineSelector };
        json anyOf = json::array();
        for (auto& g : s.anyOf)
            anyOf.push_back(conditions_json(g));
        j["line_selector"] = {
            { "where", conditions_json(s.where) },
            { "any_of", anyOf },
            { "mode", to_string(s.mode) },
            { "require_match", s.requireMatch }
        };
    }
    if (c.proration)
        j["proration_method"] = to_string(*c.proration);
    j["refund"] = {
        { "refundable", c.refund.refundable },
        { "behavior", to_string(c.refund.behavior) },
        { "cap_refund_to_original", c.refund.capRefundToOriginal }
    };
    std::visit(overloaded {
                   [&](const rule::Rate& r) { j["rate"] = r.rate.canonical_string(); },
                   [&](const rule::RatePP& r) { j["pp"] = r.pp.canonical_string(); },
                   [&](const rule::FixedUnit& r) { j["fixed"] = r.fixed.canonical_string(); },
                   [&](const rule::FixedOrder& r) { j["fixed"] = r.fixed.canonical_string(); },
                   [&](const rule::Tier& r) {
                       if (r.tierBy)
                           j["tier_by"] = *r.tierBy;
                       json tiers = json::array();
                       for (auto& b : r.tiers) {
                           tiers.push_back({ { "min", b.min.canonical_string() },
                               { "max", decimal_json(b.max) },
                               { "rate", decimal_json(b.rate) },
                               { "fixed", decimal_json(b.fixed) } });
                       }
                       j["tiers"] = tiers;
                   },
                   [&](const rule::Cap& r) {
                       j["min"] = decimal_json(r.min);
                       j["max"] = decimal_json(r.max);
                       if (r.targets) {
                           std::vector<std::string> types, scopes;
                           for (auto t : r.targets->types)
                               types.push_back(to_string(t));
                           for (auto s : r.targets->scopes)
                               scopes.push_back(to_string(s));
                           j["targets"] = {
                               { "component_ids", r.targets->componentIds },
                               { "tags_any", r.targets->tagsAny },
                               { "types", types },
                               { "scopes", scopes }
                           };
                       }
                   },
                   [&](const rule::Override& r) {
                       j["excludes"] = r.excludes;
                       j["exclude_tags"] = r.excludeTags;
                       j["reason"] = r.reason;
                       j["replacement"] = decimal_json(r.replacement);
                   } },
        c.rule);
    return j;
}
}

Result<Policy> Policy::from_json(const json& j)
{
    try {
        JsonReader r(j, INVALID_POLICY, "policy");
        Policy p;
        p.channelKey = r.string_or("channel_key", "");
        p.policyKey = r.string_or("policy_key", p.channelKey);
        if (p.policyKey.empty())
            r.fail("needs a policy_key or a channel_key");
        auto version { r.integer_or("version", 1) };
        if (version < 1 || version > std::numeric_limits<uint32_t>::max())
            r.fail("version", "must be a positive integer");
        p.version = uint32_t(version);
        p.currency = r.string_or("currency", "CLP");
        auto precision { r.integer_or("precision", 2) };
        if (precision < 0 || precision > maxPrecision)
            r.fail("precision", "must be between 0 and 18");
        p.precision = uint8_t(precision);
        auto boundary { parse_tier_boundary(r.string_or("tier_boundary", "closed_closed")) };
        if (!boundary)
            r.fail("tier_boundary", "must be closed_closed or closed_open");
        p.tierBoundary = *boundary;
        p.strict = r.boolean_or("strict", false);
        p.scopeId = r.optional_string("scope_id");
        p.effectiveFrom = r.string_or("effective_from", p.effectiveFrom);
        p.effectiveTo = r.string_or("effective_to", p.effectiveTo);
        p.active = r.boolean_or("active", true);

        if (auto comps { r.find("components") }) {
            if (!comps->is_array())
                r.fail("components", "must be an array");
            for (size_t i = 0; i < comps->size(); ++i)
                p.components.push_back(parse_component((*comps)[i], i));
        }
        if (auto v { p.validate() }; !v)
            return v.error();
        return p;
    } catch (const ErrorMessage& e) {
        return e;
    } catch (const nlohmann::json::exception& e) {
        return { INVALID_POLICY, e.what() };
    }
}

json Policy::to_json() const
{
    json j;
    j["policy_key"] = policyKey;
    j["version"] = version;
    j["channel_key"] = channelKey;
    j["currency"] = currency;
    j["precision"] = precision;
    j["tier_boundary"] = to_string(tierBoundary);
    j["strict"] = strict;
    if (scopeId)
        j["scope_id"] = *scopeId;
    j["effective_from"] = effectiveFrom;
    j["effective_to"] = effectiveTo;
    j["active"] = active;
    json comps = json::array();
    for (auto& c : components)
        comps.push_back(component_json(c));
    j["components"] = comps;
    return j;
}

json Policy::canonical_json() const
{
    json j;
    j["policy_key"] = policyKey;
    j["version"] = version;
    j["channel_key"] = channelKey;
    j["currency"] = currency;
    j["precision"] = precision;
    j["tier_boundary"] = to_string(tierBoundary);
    j["strict"] = strict;
    json comps = json::array();
    for (auto c : evaluation_order())
        comps.push_back(component_json(*c));
    j["components"] = comps;
    return j;
}

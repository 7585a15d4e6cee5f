#include "nlohmann/json.hpp"
#include "policy/json_reader.hpp"
#include "result.hpp"
#include <algorithm>

using nlohmann::json;

namespace {
json money(const Decimal& d, uint8_t precision)
{
    return d.to_string(precision);
}

json optional_money(const std::optional<Decimal>& d, uint8_t precision)
{
    if (!d)
        return nullptr;
    return d->to_string(precision);
}

json optional_value(const std::optional<Decimal>& d)
{
    if (!d)
        return nullptr;
    return d->canonical_string();
}

json bracket_json(const TierBracket& b)
{
    return {
        { "min", b.min.canonical_string() },
        { "max", optional_value(b.max) },
        { "rate", optional_value(b.rate) },
        { "fixed", optional_value(b.fixed) }
    };
}

json line_json(const Line& l)
{
    json amounts(json::object());
    for (auto& [k, v] : l.amounts)
        amounts[k] = v.canonical_string();
    return {
        { "line_id", l.id },
        { "net", l.net.canonical_string() },
        { "gross", l.gross.canonical_string() },
        { "tax", l.tax.canonical_string() },
        { "quantity", l.quantity.canonical_string() },
        { "shipping", l.shipping.canonical_string() },
        { "discount", l.discount.canonical_string() },
        { "unit_price", l.unitPrice.canonical_string() },
        { "category", l.category },
        { "sku", l.sku },
        { "flags", l.flags },
        { "attributes", l.attributes },
        { "amounts", std::move(amounts) }
    };
}

template <typename T>
T parse_enum(const JsonReader& r, const char* key, std::optional<T> (*parse)(std::string_view), T def)
{
    auto s { r.optional_string(key) };
    if (!s)
        return def;
    auto v { parse(*s) };
    if (!v)
        r.fail(key, "unknown value \"" + *s + "\"");
    return *v;
}
}

bool BreakdownEntry::has_tag(const std::string& tag) const
{
    return std::binary_search(tags.begin(), tags.end(), tag);
}

json BreakdownEntry::to_json(uint8_t precision) const
{
    json j {
        { "component_id", componentId },
        { "component_name", componentName },
        { "type", ::to_string(type) },
        { "scope", ::to_string(scope) },
        { "precedence", precedence },
        { "amount", money(amount, precision) },
        { "base_used", optional_value(baseUsed) },
        { "base_spec", baseSpec },
        { "rate", optional_value(rate) },
        { "fixed", optional_value(fixed) },
        { "cap_delta", optional_money(capDelta, precision) },
        { "applied", applied },
        { "tags", tags },
        { "refund", { { "refundable", refund.refundable }, { "behavior", ::to_string(refund.behavior) }, { "cap_refund_to_original", refund.capRefundToOriginal } } },
        { "proration_method", ::to_string(proration) },
        { "applied_line_ids", appliedLineIds },
        { "excluded_line_count", excludedLineCount }
    };
    j["override_reason"] = overrideReason ? json(*overrideReason) : json(nullptr);
    j["discard_reason"] = discardReason ? json(*discardReason) : json(nullptr);
    if (!tierSelected.empty()) {
        json arr(json::array());
        for (auto& t : tierSelected) {
            json tj {
                { "value", t.value.canonical_string() },
                { "bracket", bracket_json(t.bracket) }
            };
            if (t.lineId)
                tj["line_id"] = *t.lineId;
            arr.push_back(std::move(tj));
        }
        j["tier_selected"] = std::move(arr);
    } else {
        j["tier_selected"] = nullptr;
    }
    if (capApplied) {
        j["cap_applied"] = {
            { "bound", capApplied->bound },
            { "limit", optional_money(capApplied->limit, precision) },
            { "target_sum_before", money(capApplied->targetSumBefore, precision) },
            { "delta", money(capApplied->delta, precision) },
            { "targets_matched", capApplied->targetsMatched }
        };
    } else {
        j["cap_applied"] = nullptr;
    }
    return j;
}

Result<BreakdownEntry> BreakdownEntry::from_json(const json& j)
{
    try {
        JsonReader r(j, INVALID_COMPONENT, "breakdown entry");
        BreakdownEntry e;
        e.componentId = r.string("component_id");
        e.componentName = r.string_or("component_name", e.componentId);
        e.type = parse_enum(r, "type", &parse_component_type, ComponentType::Rate);
        e.scope = parse_enum(r, "scope", &parse_scope, Scope::Line);
        e.precedence = int32_t(r.integer_or("precedence", 100));
        e.amount = r.decimal("amount");
        e.baseUsed = r.optional_decimal("base_used");
        e.baseSpec = r.string_or("base_spec", "net");
        e.rate = r.optional_decimal("rate");
        e.fixed = r.optional_decimal("fixed");
        e.capDelta = r.optional_decimal("cap_delta");
        e.overrideReason = r.optional_string("override_reason");
        e.applied = r.boolean_or("applied", true);
        e.discardReason = r.optional_string("discard_reason");
        e.tags = r.strings("tags");
        std::sort(e.tags.begin(), e.tags.end());
        e.proration = parse_enum(r, "proration_method", &parse_proration_method, ProrationMethod::ByNet);
        e.appliedLineIds = r.strings("applied_line_ids");
        e.excludedLineCount = size_t(r.integer_or("excluded_line_count", 0));
        if (auto rf { r.find("refund") }) {
            JsonReader rr(*rf, INVALID_COMPONENT, "breakdown refund");
            e.refund.refundable = rr.boolean_or("refundable", true);
            e.refund.behavior = parse_enum(rr, "behavior", &parse_refund_behavior, RefundBehavior::Proportional);
            e.refund.capRefundToOriginal = rr.boolean_or("cap_refund_to_original", true);
        }
        if (auto ts { r.find("tier_selected") }) {
            for (auto& t : *ts) {
                JsonReader tr(t, INVALID_COMPONENT, "tier_selected");
                JsonReader br(tr.obj.at("bracket"), INVALID_COMPONENT, "tier bracket");
                e.tierSelected.push_back({
                    .lineId = tr.optional_string("line_id"),
                    .value = tr.decimal("value"),
                    .bracket = {
                        .min = br.decimal("min"),
                        .max = br.optional_decimal("max"),
                        .rate = br.optional_decimal("rate"),
                        .fixed = br.optional_decimal("fixed"),
                    },
                });
            }
        }
        if (auto ca { r.find("cap_applied") }) {
            JsonReader cr(*ca, INVALID_COMPONENT, "cap_applied");
            e.capApplied = CapApplied {
                .bound = cr.string_or("bound", "none"),
                .limit = cr.optional_decimal("limit"),
                .targetSumBefore = cr.decimal_or("target_sum_before", Decimal::zero()),
                .delta = cr.decimal_or("delta", Decimal::zero()),
                .targetsMatched = cr.strings("targets_matched"),
            };
        }
        return e;
    } catch (const ErrorMessage& e) {
        return e;
    } catch (const json::exception& e) {
        return { INVALID_COMPONENT, e.what() };
    }
}

json to_json(const Warning& w)
{
    json j {
        { "code", w.code },
        { "message", w.message }
    };
    j["component_id"] = w.componentId ? json(*w.componentId) : json(nullptr);
    return j;
}

Result<Warning> warning_from_json(const json& j)
{
    try {
        JsonReader r(j, INVALID_COMPONENT, "warning");
        return Warning { r.string("code"), r.string_or("message", ""), r.optional_string("component_id") };
    } catch (const ErrorMessage& e) {
        return e;
    }
}

json to_json(const LineAllocation& a, uint8_t precision)
{
    json components(json::array());
    for (auto& c : a.components) {
        components.push_back({
            { "component_id", c.componentId },
            { "amount", money(c.amount, precision) },
            { "proration_method", to_string(c.proration) },
            { "proration_weight", c.weight.to_string(Decimal::ratioScale) },
        });
    }
    return {
        { "line_id", a.lineId },
        { "fee_amount", money(a.feeAmount, precision) },
        { "components", std::move(components) }
    };
}

Result<LineAllocation> allocation_from_json(const json& j)
{
    try {
        JsonReader r(j, INVALID_LINE, "allocation");
        LineAllocation a;
        a.lineId = r.string("line_id");
        a.feeAmount = r.decimal("fee_amount");
        if (auto cs { r.find("components") }) {
            for (auto& c : *cs) {
                JsonReader cr(c, INVALID_LINE, "allocation component");
                a.components.push_back({
                    .componentId = cr.string("component_id"),
                    .amount = cr.decimal("amount"),
                    .proration = parse_enum(cr, "proration_method", &parse_proration_method, ProrationMethod::ByNet),
                    .weight = cr.decimal_or("proration_weight", Decimal::zero()),
                });
            }
        }
        return a;
    } catch (const ErrorMessage& e) {
        return e;
    } catch (const json::exception& e) {
        return { INVALID_LINE, e.what() };
    }
}

json to_json(const Reconciliation& r, uint8_t precision)
{
    return {
        { "allocated_sum", money(r.allocatedSum, precision) },
        { "difference", money(r.difference, precision) },
        { "balanced", r.balanced }
    };
}

json to_json(const ExplainPlan& p)
{
    json discarded(json::array());
    for (auto& d : p.componentsDiscarded)
        discarded.push_back({ { "component_id", d.componentId }, { "reason", d.reason } });
    json capTargeting(json::object());
    for (auto& c : p.capTargeting)
        capTargeting[c.capId] = c.targets;
    json coverage(json::object());
    for (auto& [id, c] : p.lineCoverage)
        coverage[id] = { { "applied", c.applied }, { "excluded", c.excluded } };
    return {
        { "evaluation_order", p.evaluationOrder },
        { "components_eligible", p.componentsEligible },
        { "components_discarded", std::move(discarded) },
        { "cap_targeting", std::move(capTargeting) },
        { "line_coverage", std::move(coverage) }
    };
}

json to_json(const NormalizedInput& in)
{
    json lines(json::array());
    for (auto& l : in.lines)
        lines.push_back(line_json(l));
    return {
        { "lines", std::move(lines) },
        { "order", {
                       { "net", in.order.net.canonical_string() },
                       { "gross", in.order.gross.canonical_string() },
                       { "tax", in.order.tax.canonical_string() },
                       { "shipping", in.order.shipping.canonical_string() },
                       { "discount", in.order.discount.canonical_string() },
                       { "quantity", in.order.quantity.canonical_string() },
                   } }
    };
}

const BreakdownEntry* Calculation::find(const std::string& componentId) const
{
    for (auto& e : breakdown) {
        if (e.componentId == componentId)
            return &e;
    }
    return nullptr;
}

const LineAllocation* Calculation::line(const std::string& lineId) const
{
    for (auto& a : allocation) {
        if (a.lineId == lineId)
            return &a;
    }
    return nullptr;
}

json Calculation::to_json() const
{
    json jb(json::array());
    for (auto& e : breakdown)
        jb.push_back(e.to_json(precision));
    json ja(json::array());
    for (auto& a : allocation)
        ja.push_back(::to_json(a, precision));
    json jw(json::array());
    for (auto& w : warnings)
        jw.push_back(::to_json(w));
    return {
        { "success", true },
        { "transaction_id", transactionId },
        { "channel_key", channelKey },
        { "currency", currency },
        { "precision", precision },
        { "total_fee", money(totalFee, precision) },
        { "breakdown", std::move(jb) },
        { "allocation", std::move(ja) },
        { "warnings", std::move(jw) },
        { "reconciliation", ::to_json(reconciliation, precision) },
        { "explain_plan", ::to_json(explain) },
        { "meta", {
                      { "engine_version", meta.engineVersion },
                      { "signature", meta.signature },
                      { "policy_hash", meta.policyHash },
                      { "precision", meta.precision },
                      { "policy_key", meta.policyKey },
                      { "policy_version", meta.policyVersion },
                  } }
    };
}

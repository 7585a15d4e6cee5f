#include "calculator.hpp"
#include "allocation.hpp"
#include "signature.hpp"
#include "version.hpp"
#include <algorithm>

namespace {

bool contains(const std::vector<std::string>& v, const std::string& s)
{
    return std::find(v.begin(), v.end(), s) != v.end();
}

std::string join(const std::vector<std::string>& v)
{
    std::string out;
    for (auto& s : v) {
        if (!out.empty())
            out += ", ";
        out += s;
    }
    return out;
}

bool override_matches(const rule::Override& o, const std::string& componentId,
    const std::vector<std::string>& tags)
{
    if (contains(o.excludes, componentId))
        return true;
    return std::any_of(tags.begin(), tags.end(), [&](const std::string& t) {
        return contains(o.excludeTags, t);
    });
}

bool cap_target_matches(const CapTargets& t, const BreakdownEntry& e)
{
    if (contains(t.componentIds, e.componentId))
        return true;
    if (std::any_of(e.tags.begin(), e.tags.end(), [&](const std::string& tag) { return contains(t.tagsAny, tag); }))
        return true;
    if (std::find(t.types.begin(), t.types.end(), e.type) != t.types.end())
        return true;
    return std::find(t.scopes.begin(), t.scopes.end(), e.scope) != t.scopes.end();
}

struct LineBase {
    Decimal sum;
    std::vector<size_t> contributing;
};

class Evaluation {
public:
    Evaluation(const Transaction& tx, const Policy& policy, NormalizedInput input,
        uint8_t precision, bool strict, ProrationMethod defaultProration)
        : tx(tx)
        , policy(policy)
        , input(std::move(input))
        , precision(precision)
        , strict(strict)
        , defaultProration(defaultProration)
    {
    }

    [[nodiscard]] Result<Calculation> run();

private:
    struct ActiveOverride {
        const Component* component;
        const rule::Override* rule;
    };

    FieldValue order_value(const std::string& path) const;
    std::optional<Decimal> order_amount(const std::string& field) const;
    bool conditions_hold(const Component&) const;
    const ActiveOverride* excluding_override(const BreakdownEntry&) const;
    BreakdownEntry make_entry(const Component&) const;
    [[nodiscard]] Result<std::vector<size_t>> select_lines(const Component&, BreakdownEntry&);
    [[nodiscard]] Result<LineBase> line_base(const BaseSpec&, const std::vector<size_t>& lines) const;
    [[nodiscard]] Result<Decimal> base(const Component&, BreakdownEntry&, std::vector<size_t>& lines) const;

    [[nodiscard]] Result<void> evaluate(const Component&, BreakdownEntry&, std::vector<size_t>& lines);
    [[nodiscard]] Result<void> evaluate_tier(const Component&, const rule::Tier&, BreakdownEntry&, std::vector<size_t>& lines);
    [[nodiscard]] Result<void> apply_cap(const Component&, const rule::Cap&, BreakdownEntry&);
    void apply_override(const Component&, const rule::Override&, BreakdownEntry&);

    void warn(std::string code, std::string message, const std::string& componentId)
    {
        warnings.push_back({ std::move(code), std::move(message), componentId });
    }
    Decimal rounded(const Decimal& d) const { return d.round(precision); }

    const Transaction& tx;
    const Policy& policy;
    NormalizedInput input;
    const uint8_t precision;
    const bool strict;
    const ProrationMethod defaultProration;

    std::vector<const Component*> order;
    size_t position { 0 }; // index of the component under evaluation
    std::vector<BreakdownEntry> breakdown;
    std::vector<std::vector<size_t>> entryLines; // applicable lines per breakdown entry
    std::vector<ActiveOverride> overrides;
    std::vector<Warning> warnings;
    ExplainPlan explain;
};

std::optional<Decimal> Evaluation::order_amount(const std::string& field) const
{
    if (auto a { input.order.amount(field) })
        return a;
    // custom amounts are summed over the lines that carry them
    std::optional<Decimal> sum;
    for (auto& l : input.lines) {
        if (auto it { l.amounts.find(field) }; it != l.amounts.end())
            sum = sum.value_or(Decimal::zero()) + it->second;
    }
    return sum;
}

FieldValue Evaluation::order_value(const std::string& path) const
{
    constexpr std::string_view orderPrefix { "order." };
    constexpr std::string_view contextPrefix { "context." };
    if (path.starts_with(orderPrefix)) {
        if (auto a { order_amount(path.substr(orderPrefix.size())) })
            return *a;
        return std::monostate {};
    }
    if (path == "channel_key")
        return tx.channelKey;
    if (path == "currency")
        return tx.currency.value_or(policy.currency);
    if (path == "line_count")
        return Decimal(int64_t(input.lines.size()));
    std::string key { path.starts_with(contextPrefix) ? path.substr(contextPrefix.size()) : path };
    if (auto it { tx.context.find(key) }; it != tx.context.end())
        return it->second;
    return std::monostate {};
}

bool Evaluation::conditions_hold(const Component& c) const
{
    return std::all_of(c.conditions.begin(), c.conditions.end(), [&](const Condition& cond) {
        return cond.holds(order_value(cond.field));
    });
}

auto Evaluation::excluding_override(const BreakdownEntry& e) const -> const ActiveOverride*
{
    for (auto& o : overrides) {
        if (override_matches(*o.rule, e.componentId, e.tags))
            return &o;
    }
    return nullptr;
}

BreakdownEntry Evaluation::make_entry(const Component& c) const
{
    BreakdownEntry e;
    e.componentId = c.id;
    e.componentName = c.name.empty() ? c.id : c.name;
    e.type = c.type();
    e.scope = c.scope;
    e.precedence = c.precedence;
    e.baseSpec = c.base.to_string();
    e.tags.assign(c.tags.begin(), c.tags.end());
    e.refund = c.refund;
    e.proration = c.proration.value_or(defaultProration);
    std::visit(overloaded {
                   [&](const rule::Rate& r) { e.rate = r.rate; },
                   [&](const rule::RatePP& r) { e.rate = r.pp; },
                   [&](const rule::FixedUnit& r) { e.fixed = r.fixed; },
                   [&](const rule::FixedOrder& r) { e.fixed = r.fixed; },
                   [&](const rule::Override& r) {
                       if (r.replacement)
                           e.fixed = r.replacement;
                   },
                   [](const auto&) {} },
        c.rule);
    return e;
}

Result<std::vector<size_t>> Evaluation::select_lines(const Component& c, BreakdownEntry& e)
{
    std::vector<size_t> selected;
    std::vector<std::string> excluded;
    const bool useSelector { c.lineSelector && c.scope == Scope::Line };
    if (c.lineSelector && c.scope == Scope::Order) {
        if (strict)
            return { INVALID_LINE_SELECTOR, "line_selector not allowed for order scope in component \"" + c.id + "\"" };
        warn("LINE_SELECTOR_ON_ORDER_SCOPE", "line_selector ignored for order scope", c.id);
    }
    for (size_t i = 0; i < input.lines.size(); ++i) {
        auto& l { input.lines[i] };
        if (!useSelector || c.lineSelector->matches([&](const std::string& f) { return l.value(f); }))
            selected.push_back(i);
        else
            excluded.push_back(l.id);
    }

    auto& coverage { explain.lineCoverage[c.id] };
    for (auto i : selected) {
        e.appliedLineIds.push_back(input.lines[i].id);
        coverage.applied.push_back(input.lines[i].id);
    }
    coverage.excluded = excluded;
    e.excludedLineCount = excluded.size();

    if (useSelector && selected.empty()) {
        if (c.lineSelector->requireMatch)
            return { LINE_SELECTOR_NO_MATCH, "line_selector of component \"" + c.id + "\" matched no line" };
        warn("NO_LINES_SELECTED", "line_selector matched no line", c.id);
    }
    return selected;
}

Result<LineBase> Evaluation::line_base(const BaseSpec& spec, const std::vector<size_t>& lines) const
{
    LineBase out;
    std::optional<ErrorMessage> missing;
    for (auto i : lines) {
        auto& l { input.lines[i] };
        auto v { spec.evaluate([&](const std::string& f) { return l.amount(f); }) };
        if (!v) {
            // lines without a custom amount do not contribute
            if (v.error().code == MISSING_BASE_FIELD) {
                missing = v.error();
                continue;
            }
            return v.error();
        }
        out.sum += *v;
        out.contributing.push_back(i);
    }
    if (out.contributing.empty() && missing)
        return *missing;
    return out;
}

Result<Decimal> Evaluation::base(const Component& c, BreakdownEntry& e, std::vector<size_t>& lines) const
{
    if (c.scope == Scope::Order) {
        auto v { c.base.evaluate([&](const std::string& f) { return order_amount(f); }) };
        if (v)
            e.baseUsed = *v;
        return v;
    }
    auto lb { line_base(c.base, lines) };
    if (!lb)
        return lb.error();
    lines = std::move(lb->contributing);
    e.baseUsed = lb->sum;
    return lb->sum;
}

Result<void> Evaluation::evaluate_tier(const Component& c, const rule::Tier& t, BreakdownEntry& e, std::vector<size_t>& lines)
{
    auto find_bracket = [&](const Decimal& v) -> const TierBracket* {
        for (auto& b : t.tiers) {
            if (b.contains(v, policy.tierBoundary))
                return &b;
        }
        return nullptr;
    };
    // fixed is charged per unit
    auto charge = [](const TierBracket& b, const Decimal& base, const Decimal& quantity) {
        return Decimal::percent(base, b.rate.value_or(Decimal::zero())) + b.fixed.value_or(Decimal::zero()) * quantity;
    };

    if (c.scope == Scope::Order) {
        auto b { c.base.evaluate([&](const std::string& f) { return order_amount(f); }) };
        if (!b)
            return b.error();
        e.baseUsed = *b;
        Decimal value { *b };
        if (t.tierBy) {
            auto v { order_amount(*t.tierBy) };
            if (!v)
                return { MISSING_BASE_FIELD, "tier_by field \"" + *t.tierBy + "\" not available for component \"" + c.id + "\"" };
            value = *v;
        }
        auto bracket { find_bracket(value) };
        if (!bracket) {
            warn("NO_TIER_MATCH", "no tier matches " + value.canonical_string(), c.id);
            e.discard("no_tier_match");
            return {};
        }
        e.tierSelected.push_back({ .value = value, .bracket = *bracket });
        e.amount = rounded(charge(*bracket, *b, input.order.quantity));
        return {};
    }

    Decimal total;
    Decimal baseSum;
    std::vector<size_t> matched;
    std::vector<std::string> unmatched;
    std::optional<ErrorMessage> missing;
    for (auto i : lines) {
        auto& l { input.lines[i] };
        auto b { c.base.evaluate([&](const std::string& f) { return l.amount(f); }) };
        if (!b) {
            if (b.error().code == MISSING_BASE_FIELD) {
                missing = b.error();
                continue;
            }
            return b.error();
        }
        Decimal value { *b };
        if (t.tierBy) {
            auto v { l.amount(*t.tierBy) };
            if (!v) {
                missing = ErrorMessage(MISSING_BASE_FIELD, "tier_by field \"" + *t.tierBy + "\" not available for component \"" + c.id + "\"");
                continue;
            }
            value = *v;
        }
        auto bracket { find_bracket(value) };
        if (!bracket) {
            unmatched.push_back(l.id);
            continue;
        }
        e.tierSelected.push_back({ .lineId = l.id, .value = value, .bracket = *bracket });
        total += charge(*bracket, *b, l.quantity);
        baseSum += *b;
        matched.push_back(i);
    }
    if (matched.empty() && unmatched.empty() && missing)
        return *missing;
    e.baseUsed = baseSum;
    if (!unmatched.empty())
        warn("NO_TIER_MATCH", "no tier matches lines " + join(unmatched), c.id);
    if (matched.empty()) {
        e.discard("no_tier_match");
        return {};
    }
    lines = std::move(matched);
    e.amount = rounded(total);
    return {};
}

Result<void> Evaluation::apply_cap(const Component& c, const rule::Cap& cap, BreakdownEntry& e)
{
    const bool emptyTargets { cap.targets && cap.targets->empty() };
    if (emptyTargets) {
        if (strict)
            return { CAP_TARGETS_EMPTY, "cap component \"" + c.id + "\" has an empty targets object" };
        warn("CAP_TARGETS_EMPTY", "empty targets, capping all prior components", c.id);
    }
    const bool filtered { cap.targets && !emptyTargets };
    if (filtered) {
        for (auto& id : cap.targets->componentIds) {
            auto it { std::find_if(order.begin(), order.end(), [&](const Component* o) { return o->id == id; }) };
            if (it == order.end() || size_t(it - order.begin()) <= position)
                continue;
            if (strict)
                return { INVALID_COMPONENT, "cap component \"" + c.id + "\" targets \"" + id + "\" which is evaluated after it" };
            warn("CAP_TARGET_AFTER_CAP", "target \"" + id + "\" is evaluated after the cap", c.id);
        }
    }

    std::vector<size_t> targets;
    Decimal sum;
    for (size_t i = 0; i < breakdown.size(); ++i) {
        auto& t { breakdown[i] };
        if (!t.applied || is_modifier_type(t.type))
            continue;
        if (filtered && !cap_target_matches(*cap.targets, t))
            continue;
        targets.push_back(i);
        sum += t.amount;
    }
    if (targets.empty()) {
        warn("CAP_NO_TARGETS", "cap matched no prior component", c.id);
        e.discard("cap_no_targets");
        return {};
    }

    // bounds are rounded so the capped sum stays inside them
    std::optional<Decimal> max, min;
    if (cap.max)
        max = cap.max->round(precision, RoundingMode::Floor);
    if (cap.min)
        min = cap.min->round(precision, RoundingMode::Ceil);
    auto clamped { Decimal::clamp(sum, min, max) };
    auto delta { sum - clamped };

    CapApplied applied { .bound = "none", .targetSumBefore = sum, .delta = delta };
    if (max && sum > *max) {
        applied.bound = "max";
        applied.limit = max;
    } else if (min && sum < *min) {
        applied.bound = "min";
        applied.limit = min;
    }

    std::vector<Decimal> weights;
    for (auto i : targets) {
        weights.push_back(breakdown[i].amount);
        applied.targetsMatched.push_back(breakdown[i].componentId);
    }
    if (!delta.is_zero()) {
        auto shares { Decimal::allocate(delta, weights, precision) };
        for (size_t j = 0; j < targets.size(); ++j) {
            auto& t { breakdown[targets[j]] };
            t.amount -= shares[j];
            t.capDelta = t.capDelta.value_or(Decimal::zero()) + shares[j];
        }
    }
    explain.capTargeting.push_back({ c.id, applied.targetsMatched });
    e.baseUsed = sum;
    e.amount = Decimal::zero();
    e.capApplied = std::move(applied);
    return {};
}

void Evaluation::apply_override(const Component& c, const rule::Override& o, BreakdownEntry& e)
{
    const std::string reason { o.reason.empty() ? "excluded by " + c.id : o.reason };
    for (auto& prior : breakdown) {
        if (!prior.applied || !override_matches(o, prior.componentId, prior.tags))
            continue;
        prior.discard("override_excluded");
        prior.overrideReason = reason;
    }
    overrides.push_back({ &c, &o });
    e.amount = rounded(o.replacement.value_or(Decimal::zero()));
    e.overrideReason = reason;
}

Result<void> Evaluation::evaluate(const Component& c, BreakdownEntry& e, std::vector<size_t>& lines)
{
    return std::visit(overloaded {
                          [&](const rule::Rate& r) -> Result<void> {
                              auto b { base(c, e, lines) };
                              if (!b)
                                  return b.error();
                              e.amount = rounded(Decimal::percent(*b, r.rate));
                              return {};
                          },
                          [&](const rule::RatePP& r) -> Result<void> {
                              auto b { base(c, e, lines) };
                              if (!b)
                                  return b.error();
                              e.amount = rounded(Decimal::percent(*b, r.pp));
                              return {};
                          },
                          [&](const rule::FixedUnit& r) -> Result<void> {
                              Decimal quantity;
                              for (auto i : lines)
                                  quantity += input.lines[i].quantity;
                              e.baseUsed = quantity;
                              e.amount = rounded(r.fixed * quantity);
                              return {};
                          },
                          [&](const rule::FixedOrder& r) -> Result<void> {
                              e.amount = rounded(r.fixed);
                              return {};
                          },
                          [&](const rule::Tier& t) -> Result<void> {
                              return evaluate_tier(c, t, e, lines);
                          },
                          [&](const rule::Cap& cap) -> Result<void> {
                              lines.clear();
                              return apply_cap(c, cap, e);
                          },
                          [&](const rule::Override& o) -> Result<void> {
                              apply_override(c, o, e);
                              return {};
                          } },
        c.rule);
}

Result<Calculation> Evaluation::run()
{
    order = policy.evaluation_order();
    for (auto c : order)
        explain.evaluationOrder.push_back(c->id);

    for (position = 0; position < order.size(); ++position) {
        auto& c { *order[position] };
        auto e { make_entry(c) };
        std::vector<size_t> lines;
        if (!conditions_hold(c)) {
            e.discard("condition_not_met");
        } else if (auto o { excluding_override(e) }) {
            e.discard("override_excluded");
            e.overrideReason = o->rule->reason.empty() ? "excluded by " + o->component->id : o->rule->reason;
        } else {
            auto selected { select_lines(c, e) };
            if (!selected)
                return selected.error();
            lines = std::move(*selected);
            if (lines.empty()) {
                e.discard("no_lines_selected");
            } else if (auto r { evaluate(c, e, lines) }; !r) {
                return r.error();
            }
        }
        breakdown.push_back(std::move(e));
        entryLines.push_back(std::move(lines));
    }

    Calculation out;
    out.transactionId = tx.transactionId;
    out.channelKey = tx.channelKey.empty() ? policy.channelKey : tx.channelKey;
    out.currency = tx.currency.value_or(policy.currency);
    out.precision = precision;

    Allocator allocator(input.lines, precision);
    for (size_t i = 0; i < breakdown.size(); ++i) {
        auto& e { breakdown[i] };
        out.totalFee += e.amount;
        if (e.applied)
            explain.componentsEligible.push_back(e.componentId);
        else
            explain.componentsDiscarded.push_back({ e.componentId, e.discardReason.value_or("") });
        if (!e.applied || e.amount.is_zero())
            continue;
        if (!allocator.add(e, entryLines[i]))
            warn("ZERO_WEIGHT_FALLBACK", std::string("weights by ") + to_string(e.proration) + " sum to zero, split equally", e.componentId);
    }
    out.allocation = std::move(allocator).finish();
    out.reconciliation = reconcile(out.totalFee, out.allocation);
    out.breakdown = std::move(breakdown);
    out.warnings = std::move(warnings);
    out.explain = std::move(explain);
    out.input = std::move(input);
    out.meta = {
        .engineVersion = engine_version,
        .policyHash = policy.hash(),
        .precision = precision,
        .policyKey = policy.policyKey,
        .policyVersion = policy.version
    };
    out.meta.signature = compute_signature(out, tx.context);
    return out;
}
}

Result<Calculation> calculate(const Transaction& tx, const Policy& policy, const CalculateOptions& options)
{
    if (auto v { policy.validate() }; !v)
        return v.error();
    const uint8_t precision { options.precision.value_or(policy.precision) };
    if (precision > Policy::maxPrecision)
        return { INVALID_POLICY, "precision must not exceed 18" };
    auto input { normalize(tx, precision) };
    if (!input)
        return input.error();
    try {
        return Evaluation(tx, policy, std::move(*input), precision,
            options.strict.value_or(policy.strict), options.defaultProration)
            .run();
    } catch (const Error& e) {
        // division by zero inside rounding helpers
        return ErrorMessage(e);
    }
}

#include "entry.hpp"
#include "nlohmann/json.hpp"
#include "policy/json_reader.hpp"
#include <array>
#include <chrono>
#include <ctime>

using nlohmann::json;

namespace {
template <typename T, size_t N>
std::optional<T> lookup(std::string_view s, const std::array<T, N>& values)
{
    for (auto v : values) {
        if (s == to_string(v))
            return v;
    }
    return {};
}

json optional_string(const std::optional<std::string>& s)
{
    return s ? json(*s) : json(nullptr);
}

json source_json(const std::optional<Source>& s)
{
    if (!s)
        return nullptr;
    return {
        { "module", s->module },
        { "object_type", s->objectType },
        { "object_id", s->objectId },
        { "scope_id", optional_string(s->scopeId) }
    };
}

std::string format_utc(const char* format)
{
    auto t { std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()) };
    std::tm tm {};
    gmtime_r(&t, &tm);
    char buf[32];
    auto n { std::strftime(buf, sizeof(buf), format, &tm) };
    return { buf, n };
}

template <typename T>
T value_or_throw(Result<T>&& r)
{
    if (!r)
        throw r.error();
    return std::move(*r);
}
}

const char* to_string(EventType t)
{
    switch (t) {
    case EventType::Settle:
        return "SETTLE";
    case EventType::Adjust:
        return "ADJUST";
    case EventType::Refund:
        return "REFUND";
    case EventType::Chargeback:
        return "CHARGEBACK";
    }
    return "SETTLE";
}

const char* to_string(EntryStatus s)
{
    switch (s) {
    case EntryStatus::Active:
        return "active";
    case EntryStatus::Adjusted:
        return "adjusted";
    case EntryStatus::Reversed:
        return "reversed";
    }
    return "active";
}

const char* to_string(AdjustmentMode m)
{
    return m == AdjustmentMode::Manual ? "MANUAL" : "AUTO";
}

std::optional<EventType> parse_event_type(std::string_view s)
{
    return lookup(s, std::array { EventType::Settle, EventType::Adjust, EventType::Refund, EventType::Chargeback });
}

std::optional<EntryStatus> parse_entry_status(std::string_view s)
{
    return lookup(s, std::array { EntryStatus::Active, EntryStatus::Adjusted, EntryStatus::Reversed });
}

std::optional<AdjustmentMode> parse_adjustment_mode(std::string_view s)
{
    return lookup(s, std::array { AdjustmentMode::Auto, AdjustmentMode::Manual });
}

const BreakdownEntry* LedgerEntry::find(const std::string& componentId) const
{
    for (auto& e : breakdown) {
        if (e.componentId == componentId)
            return &e;
    }
    return nullptr;
}

json to_json(const InputSnapshot& s, uint8_t precision)
{
    return {
        { "lines_count", s.linesCount },
        { "line_ids", s.lineIds },
        { "order", {
                       { "net", s.order.net.to_string(precision) },
                       { "gross", s.order.gross.to_string(precision) },
                       { "tax", s.order.tax.to_string(precision) },
                       { "shipping", s.order.shipping.to_string(precision) },
                       { "discount", s.order.discount.to_string(precision) },
                       { "quantity", s.order.quantity.canonical_string() },
                   } }
    };
}

Result<InputSnapshot> input_snapshot_from_json(const json& j)
{
    try {
        JsonReader r(j, INVALID_LINE, "input_snapshot");
        InputSnapshot s;
        s.linesCount = size_t(r.integer_or("lines_count", 0));
        s.lineIds = r.strings("line_ids");
        if (auto o { r.find("order") }) {
            JsonReader orr(*o, INVALID_LINE, "input_snapshot order");
            s.order.net = orr.decimal_or("net", Decimal::zero());
            s.order.gross = orr.decimal_or("gross", Decimal::zero());
            s.order.tax = orr.decimal_or("tax", Decimal::zero());
            s.order.shipping = orr.decimal_or("shipping", Decimal::zero());
            s.order.discount = orr.decimal_or("discount", Decimal::zero());
            s.order.quantity = orr.decimal_or("quantity", Decimal::zero());
        }
        return s;
    } catch (const ErrorMessage& e) {
        return e;
    }
}

json to_json(const AdjustmentInfo& a, uint8_t precision)
{
    return {
        { "mode", to_string(a.mode) },
        { "amount", a.amount.to_string(precision) },
        { "reason", a.reason },
        { "coverage", {
                          { "affected_lines", a.coverage.affectedLines },
                          { "unaffected_lines", a.coverage.unaffectedLines },
                      } }
    };
}

Result<AdjustmentInfo> adjustment_from_json(const json& j)
{
    try {
        JsonReader r(j, ERR_INVALID_ADJUSTMENT, "adjustment");
        AdjustmentInfo a;
        auto mode { parse_adjustment_mode(r.string_or("mode", "AUTO")) };
        if (!mode)
            r.fail("mode", "unknown adjustment mode");
        a.mode = *mode;
        a.amount = r.decimal_or("amount", Decimal::zero());
        a.reason = r.string_or("reason", "");
        if (auto c { r.find("coverage") }) {
            JsonReader cr(*c, ERR_INVALID_ADJUSTMENT, "coverage");
            a.coverage.affectedLines = cr.strings("affected_lines");
            a.coverage.unaffectedLines = cr.strings("unaffected_lines");
        }
        return a;
    } catch (const ErrorMessage& e) {
        return e;
    }
}

json LedgerEntry::to_json() const
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
    json jp(json::array());
    for (auto& p : refundPlan) {
        jp.push_back({
            { "component_id", p.componentId },
            { "type", ::to_string(p.type) },
            { "original_amount", p.originalAmount.to_string(precision) },
            { "refund_amount", p.refundAmount.to_string(precision) },
            { "reason", p.reason },
        });
    }
    json j {
        { "transaction_id", transactionId },
        { "channel_key", channelKey },
        { "as_of", asOf },
        { "event_type", ::to_string(eventType) },
        { "status", ::to_string(status) },
        { "currency", currency },
        { "precision", precision },
        { "total_fee", totalFee.to_string(precision) },
        { "breakdown", std::move(jb) },
        { "allocation", std::move(ja) },
        { "warnings", std::move(jw) },
        { "refund_plan", std::move(jp) },
        { "policy_snapshot", {
                                 { "policy_key", policySnapshot.policyKey },
                                 { "version", policySnapshot.version },
                                 { "components_count", policySnapshot.componentsCount },
                                 { "policy_hash", policySnapshot.policyHash },
                             } },
        { "input_snapshot", ::to_json(inputSnapshot, precision) },
        { "signature", signature },
        { "created_at", createdAt }
    };
    j["entry_id"] = entryId ? json(entryId->value()) : json(nullptr);
    j["parent_entry_id"] = parentEntryId ? json(parentEntryId->value()) : json(nullptr);
    j["adjustment"] = adjustment ? ::to_json(*adjustment, precision) : json(nullptr);
    j["idempotency_key"] = optional_string(idempotencyKey);
    j["source"] = source_json(source);
    return j;
}

Result<LedgerEntry> LedgerEntry::from_json(const json& j)
{
    try {
        JsonReader r(j, PERSIST_FAILED, "ledger entry");
        LedgerEntry e;
        if (auto id { r.find("entry_id") })
            e.entryId = EntryId(id->get<uint64_t>());
        if (auto id { r.find("parent_entry_id") })
            e.parentEntryId = EntryId(id->get<uint64_t>());
        e.transactionId = r.string("transaction_id");
        e.channelKey = r.string_or("channel_key", "");
        e.asOf = r.string_or("as_of", "");
        auto eventType { parse_event_type(r.string_or("event_type", "SETTLE")) };
        if (!eventType)
            r.fail("event_type", "unknown event type");
        e.eventType = *eventType;
        auto status { parse_entry_status(r.string_or("status", "active")) };
        if (!status)
            r.fail("status", "unknown status");
        e.status = *status;
        e.currency = r.string_or("currency", "");
        e.precision = uint8_t(r.integer_or("precision", 2));
        e.totalFee = r.decimal("total_fee");
        if (auto arr { r.find("breakdown") }) {
            for (auto& b : *arr)
                e.breakdown.push_back(value_or_throw(BreakdownEntry::from_json(b)));
        }
        if (auto arr { r.find("allocation") }) {
            for (auto& a : *arr)
                e.allocation.push_back(value_or_throw(allocation_from_json(a)));
        }
        if (auto arr { r.find("warnings") }) {
            for (auto& w : *arr)
                e.warnings.push_back(value_or_throw(warning_from_json(w)));
        }
        if (auto arr { r.find("refund_plan") }) {
            for (auto& p : *arr) {
                JsonReader pr(p, ERR_INVALID_ADJUSTMENT, "refund_plan");
                auto type { parse_component_type(pr.string_or("type", "RATE")) };
                if (!type)
                    pr.fail("type", "unknown component type");
                e.refundPlan.push_back({
                    .componentId = pr.string("component_id"),
                    .type = *type,
                    .originalAmount = pr.decimal("original_amount"),
                    .refundAmount = pr.decimal("refund_amount"),
                    .reason = pr.string_or("reason", ""),
                });
            }
        }
        if (auto ps { r.find("policy_snapshot") }) {
            JsonReader pr(*ps, INVALID_POLICY, "policy_snapshot");
            e.policySnapshot = {
                .policyKey = pr.string_or("policy_key", ""),
                .version = uint32_t(pr.integer_or("version", 1)),
                .componentsCount = size_t(pr.integer_or("components_count", 0)),
                .policyHash = pr.string_or("policy_hash", ""),
            };
        }
        if (auto is { r.find("input_snapshot") })
            e.inputSnapshot = value_or_throw(input_snapshot_from_json(*is));
        if (auto a { r.find("adjustment") })
            e.adjustment = value_or_throw(adjustment_from_json(*a));
        e.signature = r.string_or("signature", "");
        e.idempotencyKey = r.optional_string("idempotency_key");
        if (auto s { r.find("source") }) {
            JsonReader sr(*s, INVALID_LINE, "source");
            e.source = Source {
                .module = sr.string_or("module", ""),
                .objectType = sr.string_or("object_type", ""),
                .objectId = sr.string_or("object_id", ""),
                .scopeId = sr.optional_string("scope_id"),
            };
        }
        e.createdAt = r.string_or("created_at", "");
        return e;
    } catch (const ErrorMessage& e) {
        return e;
    } catch (const json::exception& e) {
        return { PERSIST_FAILED, e.what() };
    }
}

LedgerEntry make_settle_entry(const Calculation& c, const Policy& policy, std::string asOf,
    std::optional<std::string> idempotencyKey, std::optional<Source> source)
{
    LedgerEntry e;
    e.transactionId = c.transactionId.empty()
        ? "TXN-" + c.meta.signature.substr(0, 16)
        : c.transactionId;
    e.channelKey = c.channelKey;
    e.asOf = std::move(asOf);
    e.eventType = EventType::Settle;
    e.currency = c.currency;
    e.precision = c.precision;
    e.totalFee = c.totalFee;
    e.breakdown = c.breakdown;
    e.allocation = c.allocation;
    e.warnings = c.warnings;
    e.policySnapshot = {
        .policyKey = policy.policyKey,
        .version = policy.version,
        .componentsCount = policy.components.size(),
        .policyHash = c.meta.policyHash,
    };
    e.inputSnapshot.linesCount = c.input.lines.size();
    e.inputSnapshot.order = c.input.order;
    for (auto& l : c.input.lines)
        e.inputSnapshot.lineIds.push_back(l.id);
    e.signature = c.meta.signature;
    e.idempotencyKey = std::move(idempotencyKey);
    e.source = std::move(source);
    e.createdAt = now_iso8601();
    return e;
}

std::string now_iso8601()
{
    return format_utc("%Y-%m-%dT%H:%M:%SZ");
}

std::string today_iso8601()
{
    return format_utc("%Y-%m-%d");
}

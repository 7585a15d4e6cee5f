#include "fee_db.hpp"
#include "db/sqlite.hpp"
#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"
#include <algorithm>

using nlohmann::json;

namespace {
#define ENTRY_COLUMNS                                                               \
    "id, transaction_id, parent_entry_id, channel_key, as_of, event_type, status, " \
    "currency, precision, total_fee, policy_key, policy_version, components_count, " \
    "policy_hash, input_snapshot, adjustment, signature, idempotency_key, "         \
    "source_module, source_object_type, source_object_id, source_scope_id, created_at"

#define SOURCE_FILTER "source_module=?1 AND source_object_type=?2 AND source_object_id=?3"

// component fields with a column of their own
constexpr const char* componentColumns[] {
    "component_id", "component_name", "type", "scope", "precedence", "amount", "applied", "tags"
};

template <typename T>
T value_or_throw(Result<T>&& r)
{
    if (!r)
        throw std::runtime_error("Database corrupted, " + std::string(r.error().err_name()) + ": " + r.error().message);
    return std::move(*r);
}

template <typename T>
T parse_column(std::optional<T> v, const std::string& s, const char* what)
{
    if (!v)
        throw std::runtime_error("Database corrupted, invalid " + std::string(what) + " \"" + s + "\"");
    return *v;
}

json parse_json(const std::string& s)
{
    try {
        return json::parse(s);
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Database corrupted, cannot parse JSON column: ") + e.what());
    }
}
}

Savepoint::Savepoint(SQLite::Database& db, std::string name)
    : db(db)
    , name(std::move(name))
{
    db.exec("SAVEPOINT " + this->name);
}

Savepoint::~Savepoint()
{
    if (!done) {
        try {
            db.exec("ROLLBACK TO " + name);
            db.exec("RELEASE " + name);
        } catch (const SQLite::Exception& e) {
            spdlog::error("Cannot roll back savepoint {}: {}", name, e.what());
        }
    }
}

void Savepoint::commit()
{
    db.exec("RELEASE " + name);
    done = true;
}

FeeDB::Database::Database(const std::string& path)
    : SQLite::Database([&]() -> auto& {
    spdlog::debug("Opening fee ledger database \"{}\"", path);
    return path; }(), SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE)
{
    exec("PRAGMA foreign_keys = ON");
    exec("CREATE TABLE IF NOT EXISTS fee_entries ("
         "id INTEGER PRIMARY KEY, "
         "transaction_id TEXT NOT NULL, "
         "parent_entry_id INTEGER DEFAULT NULL REFERENCES fee_entries(id), "
         "channel_key TEXT NOT NULL, "
         "as_of TEXT NOT NULL, "
         "event_type TEXT NOT NULL, "
         "status TEXT NOT NULL, "
         "currency TEXT NOT NULL, "
         "precision INTEGER NOT NULL, "
         "total_fee TEXT NOT NULL, " // decimal text
         "policy_key TEXT NOT NULL, "
         "policy_version INTEGER NOT NULL, "
         "components_count INTEGER NOT NULL, "
         "policy_hash TEXT NOT NULL, "
         "input_snapshot TEXT NOT NULL, " // JSON
         "adjustment TEXT DEFAULT NULL, " // JSON
         "signature TEXT NOT NULL, "
         "idempotency_key TEXT DEFAULT NULL, "
         "source_module TEXT DEFAULT NULL, "
         "source_object_type TEXT DEFAULT NULL, "
         "source_object_id TEXT DEFAULT NULL, "
         "source_scope_id TEXT DEFAULT NULL, "
         "created_at TEXT NOT NULL)");
    exec("CREATE INDEX IF NOT EXISTS fee_entries_transaction ON fee_entries (transaction_id)");
    exec("CREATE INDEX IF NOT EXISTS fee_entries_source ON fee_entries "
         "(source_module, source_object_type, source_object_id)");
    exec("CREATE INDEX IF NOT EXISTS fee_entries_policy ON fee_entries (policy_key, policy_version)");

    exec("CREATE TABLE IF NOT EXISTS fee_entry_components ("
         "entry_id INTEGER NOT NULL REFERENCES fee_entries(id) ON DELETE CASCADE, "
         "position INTEGER NOT NULL, "
         "component_id TEXT NOT NULL, "
         "component_name TEXT NOT NULL, "
         "type TEXT NOT NULL, "
         "scope TEXT NOT NULL, "
         "precedence INTEGER NOT NULL, "
         "amount TEXT NOT NULL, "
         "applied INTEGER NOT NULL, "
         "details TEXT NOT NULL, " // remaining fields as JSON
         "PRIMARY KEY(entry_id, position)) WITHOUT ROWID");
    exec("CREATE TABLE IF NOT EXISTS fee_entry_component_tags ("
         "entry_id INTEGER NOT NULL REFERENCES fee_entries(id) ON DELETE CASCADE, "
         "component_id TEXT NOT NULL, "
         "tag TEXT NOT NULL, "
         "PRIMARY KEY(entry_id, component_id, tag)) WITHOUT ROWID");
    exec("CREATE INDEX IF NOT EXISTS fee_entry_component_tags_tag ON fee_entry_component_tags (tag)");
    exec("CREATE TABLE IF NOT EXISTS fee_entry_lines ("
         "entry_id INTEGER NOT NULL REFERENCES fee_entries(id) ON DELETE CASCADE, "
         "position INTEGER NOT NULL, "
         "line_id TEXT NOT NULL, "
         "fee_amount TEXT NOT NULL, "
         "PRIMARY KEY(entry_id, position)) WITHOUT ROWID");
    exec("CREATE TABLE IF NOT EXISTS fee_entry_line_components ("
         "entry_id INTEGER NOT NULL REFERENCES fee_entries(id) ON DELETE CASCADE, "
         "line_id TEXT NOT NULL, "
         "position INTEGER NOT NULL, "
         "component_id TEXT NOT NULL, "
         "amount TEXT NOT NULL, "
         "proration_method TEXT NOT NULL, "
         "weight TEXT NOT NULL, "
         "PRIMARY KEY(entry_id, line_id, position)) WITHOUT ROWID");
    exec("CREATE TABLE IF NOT EXISTS fee_entry_warnings ("
         "entry_id INTEGER NOT NULL REFERENCES fee_entries(id) ON DELETE CASCADE, "
         "position INTEGER NOT NULL, "
         "code TEXT NOT NULL, "
         "message TEXT NOT NULL, "
         "component_id TEXT DEFAULT NULL, "
         "PRIMARY KEY(entry_id, position)) WITHOUT ROWID");
    exec("CREATE TABLE IF NOT EXISTS fee_refund_plan ("
         "entry_id INTEGER NOT NULL REFERENCES fee_entries(id) ON DELETE CASCADE, "
         "position INTEGER NOT NULL, "
         "component_id TEXT NOT NULL, "
         "type TEXT NOT NULL, "
         "original_amount TEXT NOT NULL, "
         "refund_amount TEXT NOT NULL, "
         "reason TEXT NOT NULL, "
         "PRIMARY KEY(entry_id, position)) WITHOUT ROWID");
}

FeeDB::FeeDB(const std::string& path)
    : db(path)
    , stmtEntryInsert(db, "INSERT INTO fee_entries (transaction_id, parent_entry_id, "
                          "channel_key, as_of, event_type, status, currency, precision, total_fee, "
                          "policy_key, policy_version, components_count, policy_hash, input_snapshot, "
                          "adjustment, signature, idempotency_key, source_module, source_object_type, "
                          "source_object_id, source_scope_id, created_at) "
                          "VALUES (?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?)")
    , stmtComponentInsert(db, "INSERT INTO fee_entry_components (entry_id, position, component_id, "
                              "component_name, type, scope, precedence, amount, applied, details) "
                              "VALUES (?,?,?,?,?,?,?,?,?,?)")
    , stmtTagInsert(db, "INSERT OR IGNORE INTO fee_entry_component_tags (entry_id, component_id, tag) VALUES (?,?,?)")
    , stmtLineInsert(db, "INSERT INTO fee_entry_lines (entry_id, position, line_id, fee_amount) VALUES (?,?,?,?)")
    , stmtLineComponentInsert(db, "INSERT INTO fee_entry_line_components (entry_id, line_id, position, "
                                  "component_id, amount, proration_method, weight) VALUES (?,?,?,?,?,?,?)")
    , stmtWarningInsert(db, "INSERT INTO fee_entry_warnings (entry_id, position, code, message, component_id) "
                            "VALUES (?,?,?,?,?)")
    , stmtRefundPlanInsert(db, "INSERT INTO fee_refund_plan (entry_id, position, component_id, type, "
                               "original_amount, refund_amount, reason) VALUES (?,?,?,?,?,?,?)")
    , stmtStatusUpdate(db, "UPDATE fee_entries SET status=? WHERE id=?")
    , stmtEntryById(db, "SELECT " ENTRY_COLUMNS " FROM fee_entries WHERE id=?")
    , stmtEntriesByTransaction(db, "SELECT " ENTRY_COLUMNS " FROM fee_entries WHERE transaction_id=? ORDER BY id ASC")
    , stmtEntriesBySource(db, "SELECT " ENTRY_COLUMNS " FROM fee_entries WHERE " SOURCE_FILTER " ORDER BY id ASC")
    , stmtLatestBySource(db, "SELECT " ENTRY_COLUMNS " FROM fee_entries WHERE " SOURCE_FILTER " ORDER BY id DESC LIMIT 1")
    , stmtCountBySource(db, "SELECT COUNT(*) FROM fee_entries WHERE " SOURCE_FILTER
                            " AND (?4 IS NULL OR event_type=?4)")
    , stmtPageBySource(db, "SELECT " ENTRY_COLUMNS " FROM fee_entries WHERE " SOURCE_FILTER
                           " AND (?4 IS NULL OR event_type=?4) AND id>?5 ORDER BY id ASC LIMIT ?6")
    , stmtEntriesByPolicy(db, "SELECT " ENTRY_COLUMNS " FROM fee_entries WHERE policy_key=?1 "
                              "AND (?2 IS NULL OR policy_version=?2) ORDER BY id ASC")
    , stmtComponents(db, "SELECT component_id, component_name, type, scope, precedence, amount, applied, details "
                         "FROM fee_entry_components WHERE entry_id=? ORDER BY position ASC")
    , stmtTags(db, "SELECT component_id, tag FROM fee_entry_component_tags WHERE entry_id=? ORDER BY tag ASC")
    , stmtLines(db, "SELECT line_id, fee_amount FROM fee_entry_lines WHERE entry_id=? ORDER BY position ASC")
    , stmtLineComponents(db, "SELECT line_id, component_id, amount, proration_method, weight "
                             "FROM fee_entry_line_components WHERE entry_id=? ORDER BY line_id, position ASC")
    , stmtWarnings(db, "SELECT code, message, component_id FROM fee_entry_warnings WHERE entry_id=? ORDER BY position ASC")
    , stmtRefundPlan(db, "SELECT component_id, type, original_amount, refund_amount, reason "
                         "FROM fee_refund_plan WHERE entry_id=? ORDER BY position ASC")
    , stmtTagAmounts(db, "SELECT t.tag, c.amount FROM fee_entries e "
                         "JOIN fee_entry_components c ON c.entry_id=e.id "
                         "JOIN fee_entry_component_tags t ON t.entry_id=e.id AND t.component_id=c.component_id "
                         "WHERE e.source_module=?1 AND e.source_object_type=?2 AND e.source_object_id=?3")
{
}

EntryId FeeDB::save_entry(const LedgerEntry& e)
{
    Savepoint sp(db, "save_entry");
    const auto p { e.precision };
    std::optional<std::string> sourceModule, sourceObjectType, sourceObjectId, sourceScopeId;
    if (e.source) {
        sourceModule = e.source->module;
        sourceObjectType = e.source->objectType;
        sourceObjectId = e.source->objectId;
        sourceScopeId = e.source->scopeId;
    }
    std::optional<std::string> adjustment;
    if (e.adjustment)
        adjustment = to_json(*e.adjustment, p).dump();
    std::optional<uint64_t> parent;
    if (e.parentEntryId)
        parent = e.parentEntryId->value();

    stmtEntryInsert.run(e.transactionId, parent, e.channelKey, e.asOf,
        to_string(e.eventType), to_string(e.status), e.currency, p, e.totalFee.to_string(p),
        e.policySnapshot.policyKey, e.policySnapshot.version, e.policySnapshot.componentsCount,
        e.policySnapshot.policyHash, to_json(e.inputSnapshot, p).dump(), adjustment,
        e.signature, e.idempotencyKey, sourceModule, sourceObjectType, sourceObjectId,
        sourceScopeId, e.createdAt);
    const EntryId id { uint64_t(db.getLastInsertRowid()) };

    for (size_t i = 0; i < e.breakdown.size(); ++i) {
        auto& c { e.breakdown[i] };
        json details(c.to_json(p));
        for (auto key : componentColumns)
            details.erase(key);
        stmtComponentInsert.run(id, uint64_t(i), c.componentId, c.componentName,
            to_string(c.type), to_string(c.scope), c.precedence, c.amount.to_string(p),
            c.applied, details.dump());
        for (auto& tag : c.tags)
            stmtTagInsert.run(id, c.componentId, tag);
    }
    for (size_t i = 0; i < e.allocation.size(); ++i) {
        auto& l { e.allocation[i] };
        stmtLineInsert.run(id, uint64_t(i), l.lineId, l.feeAmount.to_string(p));
        for (size_t j = 0; j < l.components.size(); ++j) {
            auto& lc { l.components[j] };
            stmtLineComponentInsert.run(id, l.lineId, uint64_t(j), lc.componentId,
                lc.amount.to_string(p), to_string(lc.proration), lc.weight.canonical_string());
        }
    }
    for (size_t i = 0; i < e.warnings.size(); ++i) {
        auto& w { e.warnings[i] };
        stmtWarningInsert.run(id, uint64_t(i), w.code, w.message, w.componentId);
    }
    for (size_t i = 0; i < e.refundPlan.size(); ++i) {
        auto& r { e.refundPlan[i] };
        stmtRefundPlanInsert.run(id, uint64_t(i), r.componentId, to_string(r.type),
            r.originalAmount.to_string(p), r.refundAmount.to_string(p), r.reason);
    }
    sp.commit();
    return id;
}

std::optional<LedgerEntry> FeeDB::load_entry(EntryId id)
{
    auto e { stmtEntryById.one(id).process([&](const sqlite::Row& row) {
        return read_entry(row);
    }) };
    if (e)
        load_children(*e);
    return e;
}

void FeeDB::update_entry(EntryId id, const EntryPatch& patch)
{
    if (!patch.status)
        return;
    if (stmtStatusUpdate.run(to_string(*patch.status), id) == 0)
        throw std::runtime_error("Cannot update ledger entry " + std::to_string(id.value()) + ", not found");
}

std::vector<LedgerEntry> FeeDB::load_entries_by_transaction(const std::string& transactionId)
{
    return complete(stmtEntriesByTransaction.all([&](const sqlite::Row& row) {
        return read_entry(row);
    },
        transactionId));
}

EntryId FeeDB::persist(const Calculation& calc, const Policy& policy, const Source& source,
    const PersistOptions& options)
{
    auto entry { make_settle_entry(calc, policy, options.asOf.value_or(today_iso8601()),
        options.idempotencyKey, source) };
    return save_entry(entry);
}

std::optional<LedgerEntry> FeeDB::load_latest(const Source& s) const
{
    auto e { stmtLatestBySource.one(s.module, s.objectType, s.objectId).process([&](const sqlite::Row& row) {
        return read_entry(row);
    }) };
    if (e)
        load_children(*e);
    return e;
}

std::vector<LedgerEntry> FeeDB::load_all_for_source(const Source& s) const
{
    return complete(stmtEntriesBySource.all([&](const sqlite::Row& row) {
        return read_entry(row);
    },
        s.module, s.objectType, s.objectId));
}

size_t FeeDB::count_for_source(const Source& s, std::optional<EventType> eventType) const
{
    std::optional<std::string> type;
    if (eventType)
        type = to_string(*eventType);
    return stmtCountBySource.one(s.module, s.objectType, s.objectId, type).get<uint64_t>(0);
}

void FeeDB::iterate_for_source(const Source& s, const std::function<void(const LedgerEntry&)>& callback,
    const IterateOptions& options) const
{
    std::optional<std::string> type;
    if (options.eventType)
        type = to_string(*options.eventType);
    const uint64_t batchSize { std::max<size_t>(options.batchSize, 1) };
    uint64_t lastId { 0 };
    while (true) {
        auto batch { complete(stmtPageBySource.all([&](const sqlite::Row& row) {
            return read_entry(row);
        },
            s.module, s.objectType, s.objectId, type, lastId, batchSize)) };
        for (auto& e : batch)
            callback(e);
        if (batch.size() < batchSize)
            break;
        lastId = batch.back().entryId->value();
    }
}

RunningTotals FeeDB::running_totals(const Source& s) const
{
    RunningTotals out;
    stmtEntriesBySource.for_each([&](const sqlite::Row& row) {
        auto e { read_entry(row) };
        if (e.eventType == EventType::Settle)
            out.settled += e.totalFee;
        else
            out.adjusted += e.totalFee;
        out.entriesCount += 1;
    },
        s.module, s.objectType, s.objectId);
    out.net = out.settled + out.adjusted;
    return out;
}

std::map<std::string, Decimal> FeeDB::totals_by_tag(const Source& s) const
{
    std::map<std::string, Decimal> out;
    stmtTagAmounts.for_each([&](const sqlite::Row& row) {
        out[row.get<std::string>(0)] += row.get<Decimal>(1);
    },
        s.module, s.objectType, s.objectId);
    return out;
}

std::vector<LedgerEntry> FeeDB::find_by_policy(const std::string& policyKey, std::optional<uint32_t> version) const
{
    return complete(stmtEntriesByPolicy.all([&](const sqlite::Row& row) {
        return read_entry(row);
    },
        policyKey, version));
}

LedgerEntry FeeDB::read_entry(const sqlite::Row& row) const
{
    LedgerEntry e;
    e.entryId = row.get<EntryId>(0);
    e.transactionId = row.get<std::string>(1);
    e.parentEntryId = row.get_optional<EntryId>(2);
    e.channelKey = row.get<std::string>(3);
    e.asOf = row.get<std::string>(4);
    auto eventType { row.get<std::string>(5) };
    e.eventType = parse_column(parse_event_type(eventType), eventType, "event type");
    auto status { row.get<std::string>(6) };
    e.status = parse_column(parse_entry_status(status), status, "entry status");
    e.currency = row.get<std::string>(7);
    e.precision = row.get<uint8_t>(8);
    e.totalFee = row.get<Decimal>(9);
    e.policySnapshot = {
        .policyKey = row.get<std::string>(10),
        .version = row.get<uint32_t>(11),
        .componentsCount = row.get<uint64_t>(12),
        .policyHash = row.get<std::string>(13),
    };
    e.inputSnapshot = value_or_throw(input_snapshot_from_json(parse_json(row.get<std::string>(14))));
    if (auto a { row.get_optional<std::string>(15) })
        e.adjustment = value_or_throw(adjustment_from_json(parse_json(*a)));
    e.signature = row.get<std::string>(16);
    e.idempotencyKey = row.get_optional<std::string>(17);
    if (auto module { row.get_optional<std::string>(18) }) {
        e.source = Source {
            .module = *module,
            .objectType = row.get_optional<std::string>(19).value_or(""),
            .objectId = row.get_optional<std::string>(20).value_or(""),
            .scopeId = row.get_optional<std::string>(21),
        };
    }
    e.createdAt = row.get<std::string>(22);
    return e;
}

void FeeDB::load_children(LedgerEntry& e) const
{
    const EntryId id { *e.entryId };

    std::map<std::string, std::vector<std::string>> tags;
    stmtTags.for_each([&](const sqlite::Row& row) {
        tags[row.get<std::string>(0)].push_back(row.get<std::string>(1));
    },
        id);

    stmtComponents.for_each([&](const sqlite::Row& row) {
        json j(parse_json(row.get<std::string>(7)));
        auto componentId { row.get<std::string>(0) };
        j["component_id"] = componentId;
        j["component_name"] = row.get<std::string>(1);
        j["type"] = row.get<std::string>(2);
        j["scope"] = row.get<std::string>(3);
        j["precedence"] = row.get<int64_t>(4);
        j["amount"] = row.get<std::string>(5);
        j["applied"] = row.get<bool>(6);
        j["tags"] = tags[componentId];
        e.breakdown.push_back(value_or_throw(BreakdownEntry::from_json(j)));
    },
        id);

    stmtLines.for_each([&](const sqlite::Row& row) {
        e.allocation.push_back({
            .lineId = row.get<std::string>(0),
            .feeAmount = row.get<Decimal>(1),
        });
    },
        id);
    stmtLineComponents.for_each([&](const sqlite::Row& row) {
        auto lineId { row.get<std::string>(0) };
        auto it { std::find_if(e.allocation.begin(), e.allocation.end(), [&](const LineAllocation& l) {
            return l.lineId == lineId;
        }) };
        if (it == e.allocation.end())
            throw std::runtime_error("Database corrupted, line component of unknown line \"" + lineId + "\"");
        auto proration { row.get<std::string>(3) };
        it->components.push_back({
            .componentId = row.get<std::string>(1),
            .amount = row.get<Decimal>(2),
            .proration = parse_column(parse_proration_method(proration), proration, "proration method"),
            .weight = row.get<Decimal>(4),
        });
    },
        id);

    stmtWarnings.for_each([&](const sqlite::Row& row) {
        e.warnings.push_back({
            .code = row.get<std::string>(0),
            .message = row.get<std::string>(1),
            .componentId = row.get_optional<std::string>(2),
        });
    },
        id);

    stmtRefundPlan.for_each([&](const sqlite::Row& row) {
        auto type { row.get<std::string>(1) };
        e.refundPlan.push_back({
            .componentId = row.get<std::string>(0),
            .type = parse_column(parse_component_type(type), type, "component type"),
            .originalAmount = row.get<Decimal>(2),
            .refundAmount = row.get<Decimal>(3),
            .reason = row.get<std::string>(4),
        });
    },
        id);
}

std::vector<LedgerEntry> FeeDB::complete(std::vector<LedgerEntry> entries) const
{
    for (auto& e : entries)
        load_children(e);
    return entries;
}

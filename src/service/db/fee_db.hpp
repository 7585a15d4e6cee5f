#pragma once

#include "SQLiteCpp/SQLiteCpp.h"
#include "db/sqlite_fwd.hpp"
#include "ledger/interfaces.hpp"
#include <functional>
#include <map>

struct PersistOptions {
    std::optional<std::string> asOf; // today if absent
    std::optional<std::string> idempotencyKey;
};

struct IterateOptions {
    size_t batchSize { 100 };
    std::optional<EventType> eventType;
};

struct RunningTotals {
    Decimal settled;
    Decimal adjusted;
    Decimal net;
    size_t entriesCount { 0 };
};

// Nested savepoint, rolled back unless committed.
class Savepoint {
public:
    Savepoint(SQLite::Database& db, std::string name);
    Savepoint(const Savepoint&) = delete;
    ~Savepoint();
    void commit();

private:
    SQLite::Database& db;
    std::string name;
    bool done { false };
};

// SQLite ledger storage. Uses a single connection, one instance per thread.
class FeeDB : public EntryStore {
    using Statement = sqlite::Statement;

public:
    FeeDB(const std::string& path);
    [[nodiscard]] SQLite::Transaction transaction() { return SQLite::Transaction(db); }

    // EntryStore
    EntryId save_entry(const LedgerEntry&) override;
    std::optional<LedgerEntry> load_entry(EntryId) override;
    void update_entry(EntryId, const EntryPatch&) override;
    std::vector<LedgerEntry> load_entries_by_transaction(const std::string& transactionId) override;

    EntryId persist(const Calculation&, const Policy&, const Source&, const PersistOptions& = {});
    [[nodiscard]] std::optional<LedgerEntry> load_latest(const Source&) const;
    [[nodiscard]] std::vector<LedgerEntry> load_all_for_source(const Source&) const;
    [[nodiscard]] size_t count_for_source(const Source&, std::optional<EventType> = {}) const;
    void iterate_for_source(const Source&, const std::function<void(const LedgerEntry&)>& callback,
        const IterateOptions& = {}) const;
    [[nodiscard]] RunningTotals running_totals(const Source&) const;
    [[nodiscard]] std::map<std::string, Decimal> totals_by_tag(const Source&) const;
    [[nodiscard]] std::vector<LedgerEntry> find_by_policy(const std::string& policyKey,
        std::optional<uint32_t> version = {}) const;

private:
    LedgerEntry read_entry(const sqlite::Row&) const;
    void load_children(LedgerEntry&) const;
    std::vector<LedgerEntry> complete(std::vector<LedgerEntry> entries) const;

private:
    struct Database : public SQLite::Database {
        Database(const std::string& path);
    } db;
    Statement stmtEntryInsert;
    Statement stmtComponentInsert;
    Statement stmtTagInsert;
    Statement stmtLineInsert;
    Statement stmtLineComponentInsert;
    Statement stmtWarningInsert;
    Statement stmtRefundPlanInsert;
    Statement stmtStatusUpdate;
    mutable Statement stmtEntryById;
    mutable Statement stmtEntriesByTransaction;
    mutable Statement stmtEntriesBySource;
    mutable Statement stmtLatestBySource;
    mutable Statement stmtCountBySource;
    mutable Statement stmtPageBySource;
    mutable Statement stmtEntriesByPolicy;
    mutable Statement stmtComponents;
    mutable Statement stmtTags;
    mutable Statement stmtLines;
    mutable Statement stmtLineComponents;
    mutable Statement stmtWarnings;
    mutable Statement stmtRefundPlan;
    mutable Statement stmtTagAmounts;
};

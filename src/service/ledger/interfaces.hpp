#pragma once
#include "entry.hpp"
#include <optional>
#include <string>
#include <vector>

// Resolves the policy effective for a channel at a date (YYYY-MM-DD).
class PolicyLoader {
public:
    virtual ~PolicyLoader() = default;
    virtual std::optional<Policy> load_policy(const std::string& channelKey, const std::string& asOf) = 0;
};

// Storage collaborator of the ledger. Implementations report failures by
// throwing, the ledger converts them to PERSIST_FAILED. Writes of a single
// entry must be atomic.
class EntryStore {
public:
    virtual ~EntryStore() = default;
    virtual EntryId save_entry(const LedgerEntry&) = 0;
    virtual std::optional<LedgerEntry> load_entry(EntryId) = 0;
    virtual void update_entry(EntryId, const EntryPatch&) = 0;
    // entries in insertion order
    virtual std::vector<LedgerEntry> load_entries_by_transaction(const std::string& transactionId) = 0;
};

struct LedgerCallbacks {
    PolicyLoader* policies { nullptr };
    EntryStore* store { nullptr };
};

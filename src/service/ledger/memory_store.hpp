#pragma once
#include "interfaces.hpp"
#include <map>
#include <stdexcept>

// EntryStore kept in memory, for previews and tests.
class MemoryEntryStore : public EntryStore {
public:
    EntryId save_entry(const LedgerEntry& e) override
    {
        EntryId id { nextId++ };
        auto& stored { entries.emplace(id, e).first->second };
        stored.entryId = id;
        return id;
    }
    std::optional<LedgerEntry> load_entry(EntryId id) override
    {
        if (auto it { entries.find(id) }; it != entries.end())
            return it->second;
        return {};
    }
    void update_entry(EntryId id, const EntryPatch& patch) override
    {
        auto it { entries.find(id) };
        if (it == entries.end())
            throw std::runtime_error("Cannot update entry " + std::to_string(id.value()) + ", not found");
        if (patch.status)
            it->second.status = *patch.status;
    }
    std::vector<LedgerEntry> load_entries_by_transaction(const std::string& transactionId) override
    {
        std::vector<LedgerEntry> out;
        for (auto& [id, e] : entries) {
            if (e.transactionId == transactionId)
                out.push_back(e);
        }
        return out;
    }
    size_t size() const { return entries.size(); }

private:
    uint64_t nextId { 1 };
    std::map<EntryId, LedgerEntry> entries;
};

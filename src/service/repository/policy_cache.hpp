#pragma once
#include "policy/policy.hpp"
#include <map>
#include <optional>
#include <string>
#include <tuple>

// Resolved policies keyed by (channel, as-of date, scope). Not thread safe,
// owners that share it across threads must serialize access.
class PolicyCache {
    struct Key {
        std::string channelKey;
        std::string asOf;
        std::optional<std::string> scopeId;
        auto operator<=>(const Key&) const = default;
    };

public:
    [[nodiscard]] const Policy* get(const std::string& channelKey, const std::string& asOf,
        const std::optional<std::string>& scopeId) const
    {
        if (auto it { entries.find(Key { channelKey, asOf, scopeId }) }; it != entries.end())
            return &it->second;
        return nullptr;
    }
    void put(const std::string& channelKey, const std::string& asOf,
        const std::optional<std::string>& scopeId, Policy p)
    {
        entries.insert_or_assign(Key { channelKey, asOf, scopeId }, std::move(p));
    }
    // drops every entry of the channel
    void invalidate(const std::string& channelKey)
    {
        std::erase_if(entries, [&](const auto& e) { return e.first.channelKey == channelKey; });
    }
    void clear() { entries.clear(); }
    size_t size() const { return entries.size(); }

private:
    std::map<Key, Policy> entries;
};

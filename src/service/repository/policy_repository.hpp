#pragma once
#include "ledger/interfaces.hpp"
#include "policy_cache.hpp"
#include <vector>

struct PolicyRef {
    std::string policyKey;
    uint32_t version;
    std::string effectiveFrom;
    std::string effectiveTo;
};

// In-memory set of effective-dated policies, loaded from TOML or JSON
// files. Lookups go through a PolicyCache.
class PolicyRepository {
public:
    [[nodiscard]] Result<void> add(Policy);
    // a single policy or a "policies" array, returns the number added
    [[nodiscard]] Result<size_t> load_file(const std::string& path);
    [[nodiscard]] Result<size_t> load_string(std::string_view content, bool toml, std::string_view sourceName = "string");

    // Scope specific policies first, then global ones. Among the active
    // policies effective at asOf the highest version wins.
    [[nodiscard]] std::optional<Policy> load_by_channel(const std::string& channelKey,
        const std::string& asOf, const std::optional<std::string>& scopeId = {});
    [[nodiscard]] std::vector<PolicyRef> list_active(const std::string& asOf,
        const std::optional<std::string>& channelKey = {}) const;
    // active policies of the channel and scope whose effective range
    // intersects [from, to]
    [[nodiscard]] std::vector<PolicyRef> validate_no_overlap(const std::string& channelKey,
        const std::optional<std::string>& scopeId, const std::string& from, const std::string& to,
        std::optional<uint32_t> excludeVersion = {}) const;

    void clear_cache() { cache.clear(); }
    const PolicyCache& policy_cache() const { return cache; }
    size_t size() const { return policies.size(); }

private:
    const Policy* find(const std::string& channelKey, const std::string& asOf,
        const std::optional<std::string>& scopeId) const;

    std::vector<Policy> policies;
    PolicyCache cache;
};

class RepositoryPolicyLoader : public PolicyLoader {
public:
    RepositoryPolicyLoader(PolicyRepository& repository, std::optional<std::string> scopeId = {})
        : repository(repository)
        , scopeId(std::move(scopeId))
    {
    }
    std::optional<Policy> load_policy(const std::string& channelKey, const std::string& asOf) override
    {
        return repository.load_by_channel(channelKey, asOf, scopeId);
    }

private:
    PolicyRepository& repository;
    std::optional<std::string> scopeId;
};

// nlohmann::json form of a TOML document, floats and dates become strings
nlohmann::json toml_to_json(std::string_view toml, std::string_view sourceName);

#include "policy_repository.hpp"
#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"
#include "toml++/toml.hpp"
#include <charconv>
#include <fstream>
#include <sstream>

using nlohmann::json;

namespace {
json node_to_json(const toml::node& n)
{
    if (auto t { n.as_table() }) {
        json j(json::object());
        for (auto& [k, v] : *t)
            j[std::string(k.str())] = node_to_json(v);
        return j;
    }
    if (auto a { n.as_array() }) {
        json j(json::array());
        for (auto& v : *a)
            j.push_back(node_to_json(v));
        return j;
    }
    if (auto s { n.as_string() })
        return s->get();
    if (auto i { n.as_integer() })
        return i->get();
    if (auto b { n.as_boolean() })
        return b->get();
    if (auto f { n.as_floating_point() }) {
        // shortest representation that reads back to the same double
        char buf[64];
        auto r { std::to_chars(buf, buf + sizeof(buf), f->get()) };
        return std::string(buf, r.ptr);
    }
    if (auto d { n.as_date() }) {
        auto& v { d->get() };
        return spdlog::fmt_lib::format("{:04}-{:02}-{:02}", int(v.year), int(v.month), int(v.day));
    }
    throw std::runtime_error("Unsupported TOML value at line " + std::to_string(n.source().begin.line));
}

bool effective_at(const Policy& p, const std::string& asOf)
{
    return p.active && p.effectiveFrom <= asOf && asOf <= p.effectiveTo;
}

PolicyRef ref(const Policy& p)
{
    return { p.policyKey, p.version, p.effectiveFrom, p.effectiveTo };
}
}

json toml_to_json(std::string_view toml, std::string_view sourceName)
{
    toml::table tbl = toml::parse(toml, sourceName);
    return node_to_json(tbl);
}

Result<void> PolicyRepository::add(Policy p)
{
    if (auto v { p.validate() }; !v)
        return v.error();
    for (auto& existing : policies) {
        if (existing.policyKey == p.policyKey && existing.version == p.version)
            return { INVALID_POLICY, "policy " + p.policyKey + " v" + std::to_string(p.version) + " is already registered" };
    }
    cache.invalidate(p.channelKey);
    policies.push_back(std::move(p));
    return {};
}

Result<size_t> PolicyRepository::load_string(std::string_view content, bool toml, std::string_view sourceName)
{
    json doc;
    try {
        doc = toml ? toml_to_json(content, sourceName) : json::parse(content);
    } catch (const toml::parse_error& e) {
        std::stringstream ss;
        ss << "cannot parse " << sourceName << ": " << e.description() << " (" << e.source().begin << ")";
        return { INVALID_POLICY, ss.str() };
    } catch (const json::exception& e) {
        return { INVALID_POLICY, "cannot parse " + std::string(sourceName) + ": " + e.what() };
    } catch (const std::runtime_error& e) {
        return { INVALID_POLICY, std::string(sourceName) + ": " + e.what() };
    }

    std::vector<const json*> items;
    if (doc.is_array()) {
        for (auto& p : doc)
            items.push_back(&p);
    } else if (auto it { doc.find("policies") }; doc.is_object() && it != doc.end()) {
        if (!it->is_array())
            return { INVALID_POLICY, std::string(sourceName) + ": \"policies\" must be an array" };
        for (auto& p : *it)
            items.push_back(&p);
    } else {
        items.push_back(&doc);
    }

    size_t n { 0 };
    for (auto p : items) {
        auto policy { Policy::from_json(*p) };
        if (!policy)
            return policy.error();
        if (auto a { add(std::move(*policy)) }; !a)
            return a.error();
        n += 1;
    }
    return n;
}

Result<size_t> PolicyRepository::load_file(const std::string& path)
{
    std::ifstream f(path);
    if (!f)
        return { INVALID_POLICY, "cannot open policy file \"" + path + "\"" };
    std::stringstream ss;
    ss << f.rdbuf();
    const bool toml { path.ends_with(".toml") };
    if (!toml && !path.ends_with(".json"))
        return { INVALID_POLICY, "policy file \"" + path + "\" must end in .toml or .json" };
    auto n { load_string(ss.str(), toml, path) };
    if (n)
        spdlog::info("Loaded {} fee policies from \"{}\"", *n, path);
    return n;
}

const Policy* PolicyRepository::find(const std::string& channelKey, const std::string& asOf,
    const std::optional<std::string>& scopeId) const
{
    const Policy* best { nullptr };
    for (auto& p : policies) {
        if (p.channelKey != channelKey || p.scopeId != scopeId || !effective_at(p, asOf))
            continue;
        if (!best || p.version > best->version)
            best = &p;
    }
    return best;
}

std::optional<Policy> PolicyRepository::load_by_channel(const std::string& channelKey,
    const std::string& asOf, const std::optional<std::string>& scopeId)
{
    if (auto p { cache.get(channelKey, asOf, scopeId) }) {
        spdlog::debug("Policy cache hit for channel {} at {}", channelKey, asOf);
        return *p;
    }
    const Policy* p { nullptr };
    if (scopeId)
        p = find(channelKey, asOf, scopeId);
    if (!p)
        p = find(channelKey, asOf, std::nullopt);
    if (!p)
        return {};
    cache.put(channelKey, asOf, scopeId, *p);
    return *p;
}

std::vector<PolicyRef> PolicyRepository::list_active(const std::string& asOf,
    const std::optional<std::string>& channelKey) const
{
    std::vector<PolicyRef> out;
    for (auto& p : policies) {
        if (channelKey && p.channelKey != *channelKey)
            continue;
        if (effective_at(p, asOf))
            out.push_back(ref(p));
    }
    return out;
}

std::vector<PolicyRef> PolicyRepository::validate_no_overlap(const std::string& channelKey,
    const std::optional<std::string>& scopeId, const std::string& from, const std::string& to,
    std::optional<uint32_t> excludeVersion) const
{
    std::vector<PolicyRef> conflicts;
    for (auto& p : policies) {
        if (!p.active || p.channelKey != channelKey || p.scopeId != scopeId)
            continue;
        if (excludeVersion && p.version == *excludeVersion)
            continue;
        if (p.effectiveFrom <= to && from <= p.effectiveTo)
            conflicts.push_back(ref(p));
    }
    return conflicts;
}

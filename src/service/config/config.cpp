#include "config.hpp"
#include "spdlog/spdlog.h"
#include "toml++/toml.hpp"
#include <cassert>
#include <map>
#include <sstream>

using namespace std;

namespace {
std::runtime_error failed_convert(const toml::node& n)
{
    return std::runtime_error("Cannot parse configuration value starting at line "s + std::to_string(n.source().begin.line) + ", column "s + std::to_string(n.source().begin.column) + ".");
}

template <typename T>
std::optional<T> config_convert(const toml::node& n)
{
    if (auto val = n.value<T>()) {
        return val.value();
    }
    throw failed_convert(n);
}

template <>
std::optional<uint8_t> config_convert(const toml::node& n)
{
    if (auto v { n.value<int64_t>() }) {
        if (*v >= 0 && *v <= 18)
            return uint8_t(*v);
    }
    throw failed_convert(n);
}

template <>
std::optional<ProrationMethod> config_convert(const toml::node& n)
{
    if (auto sv { n.value<std::string_view>() }) {
        if (auto m { parse_proration_method(*sv) })
            return *m;
    }
    throw failed_convert(n);
}

template <>
std::optional<std::vector<std::string>> config_convert(const toml::node& n)
{
    if (n.is_array()) {
        std::vector<std::string> out;
        for (auto& e : *n.as_array()) {
            auto s { e.value<std::string>() };
            if (!s)
                throw failed_convert(e);
            out.push_back(*s);
        }
        return out;
    }
    throw failed_convert(n);
}

struct TableReaderData {
    const toml::table& tbl;
    std::string_view filepath;
    mutable std::map<toml::key, bool> keyUsed;
};

struct TableReader : public TableReaderData {
    bool report { true };
    TableReader(const toml::table& tbl, std::string_view filepath)
        : TableReaderData(tbl, filepath, {})
    {
        for (auto& [k, v] : tbl) {
            keyUsed.emplace(k, false);
        }
    }
    TableReader(const TableReader&) = delete;
    TableReader(TableReader&& a)
        : TableReaderData(std::move(a))
    {
        a.report = false;
    };
    ~TableReader()
    {
        if (report) {
            for (auto& [k, used] : keyUsed) {
                if (!used) {
                    spdlog::warn("Ignoring configuration setting \""s + std::string(k.str()) + "\" at line "s + std::to_string(k.source().begin.line) + " in "s + string(filepath));
                }
            }
        }
    }

    std::optional<TableReader> subtable(std::string_view s)
    {
        if (auto it { tbl.find(s) }; it != tbl.end()) {
            keyUsed[it->first] = true;
            if (it->second.is_table() == false)
                throw std::runtime_error("Configuration section "s + std::string(s) + " must be a table."s);
            auto p { it->second.as_table() };
            assert(p != nullptr);
            return TableReader { *p, filepath };
        }
        return std::nullopt;
    }

    struct Entry {
        const toml::node* v;

        template <typename T>
        std::optional<T> get() const
        {
            return config_convert<T>(*v);
        }
    };
    std::optional<Entry> operator[](std::string_view key) const
    {
        if (auto it { tbl.find(key) }; it != tbl.end()) {
            keyUsed[it->first] = true;
            return { Entry { &it->second } };
        }
        return std::nullopt;
    }
};

template <typename T>
void fill(
    T& dst,
    std::optional<TableReader>& tblreader,
    std::string_view tblkey)
{
    if (tblreader) {
        if (auto oe { (*tblreader)[tblkey] }) {
            if (auto v { oe->get<T>() })
                dst = *v;
        }
    }
}

template <typename T>
void fill(
    std::optional<T>& dst,
    std::optional<TableReader>& tblreader,
    std::string_view tblkey)
{
    if (tblreader) {
        if (auto oe { (*tblreader)[tblkey] }) {
            if (auto v { oe->get<T>() })
                dst = *v;
        }
    }
}

bool valid_log_level(const std::string& level)
{
    return level == "off" || spdlog::level::from_str(level) != spdlog::level::off;
}

Config read_table(const toml::table& tbl, std::string_view sourceName)
{
    Config c;
    {
        TableReader root(tbl, sourceName);

        auto s_db { root.subtable("db") };
        fill(c.data.feesdb, s_db, "path");

        auto s_engine { root.subtable("engine") };
        fill(c.engine.precision, s_engine, "precision");
        fill(c.engine.strict, s_engine, "strict");
        fill(c.engine.proration, s_engine, "proration");

        auto s_ledger { root.subtable("ledger") };
        fill(c.ledger.strict, s_ledger, "strict");
        fill(c.ledger.allowNegativeRunning, s_ledger, "allow-negative-running");

        auto s_log { root.subtable("log") };
        fill(c.log.level, s_log, "level");
        fill(c.log.calculations, s_log, "calculations");

        auto s_policies { root.subtable("policies") };
        fill(c.policies.files, s_policies, "files");
    }
    if (!valid_log_level(c.log.level))
        throw std::runtime_error("Unknown log level \"" + c.log.level + "\".");
    return c;
}

std::string describe(const toml::parse_error& err)
{
    std::stringstream ss;
    ss << "Error while parsing ";
    if (auto& p { err.source().path })
        ss << "file '" << *p << "'";
    else
        ss << "configuration";
    ss << ": " << err.description() << " (" << err.source().begin << ")";
    return ss.str();
}
}

tl::expected<Config, std::string> Config::from_file(const std::string& filename)
{
    try {
        spdlog::info("Reading configuration file \"{}\"", filename);
        toml::table tbl = toml::parse_file(filename);
        return read_table(tbl, filename);
    } catch (const toml::parse_error& err) {
        return tl::make_unexpected(describe(err));
    } catch (const std::runtime_error& e) {
        return tl::make_unexpected(std::string(e.what()));
    }
}

tl::expected<Config, std::string> Config::from_string(std::string_view toml, std::string_view sourceName)
{
    try {
        toml::table tbl = toml::parse(toml, sourceName);
        return read_table(tbl, sourceName);
    } catch (const toml::parse_error& err) {
        return tl::make_unexpected(describe(err));
    } catch (const std::runtime_error& e) {
        return tl::make_unexpected(std::string(e.what()));
    }
}

CalculateOptions Config::calculate_options() const
{
    return {
        .precision = engine.precision,
        .strict = engine.strict,
        .defaultProration = engine.proration
    };
}

LedgerOptions Config::ledger_options() const
{
    return {
        .calculation = calculate_options(),
        .strict = ledger.strict,
        .allowNegativeRunning = ledger.allowNegativeRunning,
    };
}

void Config::apply_log_level() const
{
    spdlog::set_level(spdlog::level::from_str(log.level));
}

std::string Config::dump() const
{
    toml::table tbl;
    tbl.insert_or_assign("db", toml::table {
                                   { "path", data.feesdb },
                               });
    toml::table tengine {
        { "proration", to_string(engine.proration) }
    };
    if (engine.precision)
        tengine.insert_or_assign("precision", int64_t(*engine.precision));
    if (engine.strict)
        tengine.insert_or_assign("strict", *engine.strict);
    tbl.insert_or_assign("engine", std::move(tengine));
    tbl.insert_or_assign("ledger",
        toml::table {
            { "strict", ledger.strict },
            { "allow-negative-running", ledger.allowNegativeRunning } });
    tbl.insert_or_assign("log",
        toml::table {
            { "level", log.level },
            { "calculations", log.calculations } });
    toml::array files;
    for (auto& f : policies.files)
        files.push_back(f);
    tbl.insert_or_assign("policies", toml::table { { "files", files } });
    stringstream ss;
    ss << tbl << endl;
    return ss.str();
}

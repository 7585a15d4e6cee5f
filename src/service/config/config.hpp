#pragma once

#include "ledger/fee_ledger.hpp"
#include "tl/expected.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct Config {
    struct Data {
        std::string feesdb { "fees.db3" };
    } data;
    struct Engine {
        std::optional<uint8_t> precision; // overrides the policy precision
        std::optional<bool> strict; // overrides the policy strict flag
        ProrationMethod proration { ProrationMethod::ByNet };
    } engine;
    struct Ledger {
        bool strict { true };
        bool allowNegativeRunning { false };
    } ledger;
    struct Log {
        std::string level { "info" };
        bool calculations { false }; // log every calculation of settle
    } log;
    struct Policies {
        std::vector<std::string> files;
    } policies;

    CalculateOptions calculate_options() const;
    LedgerOptions ledger_options() const;
    void apply_log_level() const;
    std::string dump() const;

    static tl::expected<Config, std::string> from_file(const std::string& filename);
    static tl::expected<Config, std::string> from_string(std::string_view toml, std::string_view sourceName = "string");
};

#include "config/config.hpp"
#include "global/globals.hpp"
#include "spdlog/spdlog.h"
#include <cassert>
#include <filesystem>
#include <fstream>
using namespace std;

void test_defaults()
{
    auto c { Config::from_string("") };
    assert(c.has_value());
    assert(c->data.feesdb == "fees.db3");
    assert(!c->engine.precision);
    assert(!c->engine.strict);
    assert(c->engine.proration == ProrationMethod::ByNet);
    assert(c->ledger.strict);
    assert(!c->ledger.allowNegativeRunning);
    assert(c->log.level == "info");
    assert(!c->log.calculations);
    assert(c->policies.files.empty());
}

void test_overrides()
{
    auto c { Config::from_string(R"(
[db]
path = "/var/lib/feeledger/fees.db3"

[engine]
precision = 4
strict = true
proration = "BY_QUANTITY"

[ledger]
strict = false
allow-negative-running = true

[log]
level = "debug"
calculations = true

[policies]
files = ["a.toml", "b.json"]
)") };
    assert(c.has_value());
    assert(c->data.feesdb == "/var/lib/feeledger/fees.db3");
    assert(c->engine.precision == 4);
    assert(c->engine.strict == true);
    assert(c->engine.proration == ProrationMethod::ByQuantity);
    assert(!c->ledger.strict);
    assert(c->ledger.allowNegativeRunning);
    assert(c->log.level == "debug");
    assert(c->log.calculations);
    assert(c->policies.files == (std::vector<std::string> { "a.toml", "b.json" }));

    auto options { c->ledger_options() };
    assert(options.calculation.precision == 4);
    assert(options.calculation.defaultProration == ProrationMethod::ByQuantity);
    assert(!options.strict);
    assert(options.allowNegativeRunning);
}

void test_invalid()
{
    auto precision { Config::from_string("[engine]\nprecision = 19\n") };
    assert(!precision);
    assert(precision.error().find("line 2") != std::string::npos);

    auto proration { Config::from_string("[engine]\nproration = \"BY_WEIGHT\"\n") };
    assert(!proration);

    auto level { Config::from_string("[log]\nlevel = \"loud\"\n") };
    assert(!level);
    assert(level.error().find("loud") != std::string::npos);

    auto section { Config::from_string("engine = 3\n") };
    assert(!section);

    auto syntax { Config::from_string("[engine\n", "broken.toml") };
    assert(!syntax);
    assert(syntax.error().starts_with("Error while parsing"));

    // unknown keys are only warned about
    auto unknown { Config::from_string("[engine]\nturbo = true\n") };
    assert(unknown.has_value());
}

void test_dump_round_trip()
{
    Config c;
    c.engine.precision = 3;
    c.engine.proration = ProrationMethod::Equal;
    c.ledger.allowNegativeRunning = true;
    c.policies.files = { "p.toml" };
    auto again { Config::from_string(c.dump(), "dump") };
    assert(again.has_value());
    assert(again->engine.precision == 3);
    assert(!again->engine.strict);
    assert(again->engine.proration == ProrationMethod::Equal);
    assert(again->ledger.allowNegativeRunning);
    assert(again->policies.files == std::vector<std::string> { "p.toml" });
}

void test_file_and_globals()
{
    auto path { (std::filesystem::temp_directory_path() / "feeledger_test_config.toml").string() };
    {
        std::ofstream f(path);
        f << "[log]\ncalculations = true\nlevel = \"warn\"\n";
    }
    auto c { Config::from_file(path) };
    std::filesystem::remove(path);
    assert(c.has_value());
    assert(!Config::from_file(path));

    set_config() = *c;
    assert(config().log.calculations);
    assert(global().conf.log.level == "warn");
    config().apply_log_level();
    assert(spdlog::default_logger()->level() == spdlog::level::warn);
}

int main()
{
    test_defaults();
    test_overrides();
    test_invalid();
    test_dump_round_trip();
    test_file_and_globals();
    return 0;
}

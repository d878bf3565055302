#pragma once
#include <cstdint>
#include <ctime>
#include <string>

enum class Strategy { PerKey, Grouped, Both };

struct Config {
    std::string date;          // yyyyMMdd
    std::string input;         // defaults to <date>.export.CSV
    std::string output;        // prefix; reports go to <output>good/ and <output>bad/
    size_t sample_bound = 10000;
    Strategy strategy = Strategy::PerKey;
    size_t workers = 0;        // 0 = hardware concurrency
    size_t reducers = 0;       // 0 = same as workers
    size_t qcap = 1 << 16;
    bool seed_set = false;
    uint64_t seed = 0;
    size_t group_arena_bytes = 64u << 20;
    std::string log_file = "loctally.err.log";
    bool help = false;
};

// current local date as 8 digits
std::string default_date();
std::string format_date(std::time_t t);

// Throws config_error on unknown options, missing values or bad numbers.
// Fills every default that depends on other options.
Config parse_args(int argc, char **argv);

const char *strategy_name(Strategy s);
std::string usage();
std::string describe_config(const Config &c);

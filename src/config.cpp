#include "config.hpp"
#include "errors.hpp"
#include <cctype>
#include <sstream>
#include <thread>

std::string format_date(std::time_t t) {
    std::tm tmv{};
    localtime_r(&t, &tmv);
    char buf[16];
    if (std::strftime(buf, sizeof(buf), "%Y%m%d", &tmv) == 0) return "19700101";
    return buf;
}

std::string default_date() {
    return format_date(std::time(nullptr));
}

static size_t parse_size(const std::string &opt, const std::string &v) {
    if (v.empty() || !std::isdigit(static_cast<unsigned char>(v[0]))) {
        throw config_error(opt + ": expected a non-negative number, got '" + v + "'");
    }
    try {
        size_t pos = 0;
        unsigned long long n = std::stoull(v, &pos);
        if (pos != v.size()) throw config_error(opt + ": trailing characters in '" + v + "'");
        return static_cast<size_t>(n);
    } catch (const std::logic_error &) {
        throw config_error(opt + ": invalid number '" + v + "'");
    }
}

static bool valid_date(const std::string &d) {
    if (d.size() != 8) return false;
    for (char c : d) if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    return true;
}

const char *strategy_name(Strategy s) {
    switch (s) {
    case Strategy::PerKey: return "per-key";
    case Strategy::Grouped: return "grouped";
    case Strategy::Both: return "both";
    }
    return "?";
}

Config parse_args(int argc, char **argv) {
    Config c;
    auto value = [&](int &i, const std::string &opt) -> std::string {
        if (i + 1 >= argc) throw config_error(opt + ": missing value");
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--date") c.date = value(i, a);
        else if (a == "--input") c.input = value(i, a);
        else if (a == "--output") c.output = value(i, a);
        else if (a == "--sample-bound") c.sample_bound = parse_size(a, value(i, a));
        else if (a == "--workers") c.workers = parse_size(a, value(i, a));
        else if (a == "--reducers") c.reducers = parse_size(a, value(i, a));
        else if (a == "--qcap") c.qcap = parse_size(a, value(i, a));
        else if (a == "--group-arena-bytes") c.group_arena_bytes = parse_size(a, value(i, a));
        else if (a == "--log-file") c.log_file = value(i, a);
        else if (a == "--seed") { c.seed = parse_size(a, value(i, a)); c.seed_set = true; }
        else if (a == "--strategy") {
            std::string s = value(i, a);
            if (s == "per-key" || s == "good") c.strategy = Strategy::PerKey;
            else if (s == "grouped" || s == "bad") c.strategy = Strategy::Grouped;
            else if (s == "both") c.strategy = Strategy::Both;
            else throw config_error("--strategy: expected per-key, grouped or both, got '" + s + "'");
        }
        else if (a == "--help" || a == "-h") c.help = true;
        else throw config_error("unknown option '" + a + "'");
    }

    if (c.date.empty()) c.date = default_date();
    else if (!valid_date(c.date)) throw config_error("--date: expected yyyyMMdd, got '" + c.date + "'");
    if (c.input.empty()) c.input = c.date + ".export.CSV";
    if (c.output.empty()) c.output = "/tmp/gdelt-" + c.date;
    if (c.workers == 0) {
        c.workers = std::thread::hardware_concurrency();
        if (c.workers == 0) c.workers = 4;
    }
    if (c.reducers == 0) c.reducers = c.workers;
    if (c.qcap == 0) throw config_error("--qcap: must be positive");
    return c;
}

std::string usage() {
    return
        "usage: loctally [options]\n"
        "  --date yyyyMMdd          GDELT export date (default: today)\n"
        "  --input PATH             input file, '-' for stdin (default: <date>.export.CSV)\n"
        "  --output PREFIX          report prefix (default: /tmp/gdelt-<date>)\n"
        "  --sample-bound N         records kept by the sampler (default: 10000)\n"
        "  --strategy S             per-key | grouped | both (default: per-key)\n"
        "  --workers N              worker threads (default: hardware concurrency)\n"
        "  --reducers N             grouped strategy reducer shards (default: workers)\n"
        "  --qcap N                 record queue capacity (default: 65536)\n"
        "  --seed N                 sampler seed (default: random)\n"
        "  --group-arena-bytes N    per-location subject buffer for grouped, 0 = unbounded (default: 64MiB)\n"
        "  --log-file PATH          append log copy here, empty to disable (default: loctally.err.log)\n";
}

std::string describe_config(const Config &c) {
    std::ostringstream os;
    os << "date=" << c.date
       << " input=" << c.input
       << " output=" << c.output
       << " sample_bound=" << c.sample_bound
       << " strategy=" << strategy_name(c.strategy)
       << " workers=" << c.workers
       << " reducers=" << c.reducers
       << " qcap=" << c.qcap
       << " seed=" << (c.seed_set ? std::to_string(c.seed) : std::string("random"))
       << " group_arena_bytes=" << c.group_arena_bytes;
    return os.str();
}

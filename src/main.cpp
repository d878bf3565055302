// src/main.cpp
// LocTally entry point: parse options, run the configured strategies, and
// map failures to exit codes (1 = run failed, 2 = strategies disagree).

#include "config.hpp"
#include "errors.hpp"
#include "global_ctl.hpp"
#include "orchestrator.hpp"
#include "util_log.hpp"

#include <atomic>
#include <csignal>
#include <exception>
#include <iostream>
#include <new>
#include <string>

std::atomic<bool> g_terminate{false};

void handle_sigint(int) {
    g_terminate.store(true);
}

int main(int argc, char **argv) {
    std::signal(SIGINT, handle_sigint);

    Config cfg;
    try {
        cfg = parse_args(argc, argv);
    } catch (const config_error &e) {
        std::cerr << "loctally: " << e.what() << "\n" << usage();
        return 1;
    }
    if (cfg.help) {
        std::cout << usage();
        return 0;
    }
    set_log_file(cfg.log_file);
    safe_log("Starting LocTally; " + describe_config(cfg));

    RunReport report;
    try {
        Orchestrator orch(cfg);
        report = orch.run();
    } catch (const source_unavailable &e) {
        safe_log(std::string("source unavailable: ") + e.what());
        return 1;
    } catch (const sink_write_failure &e) {
        safe_log(std::string("sink write failure: ") + e.what());
        return 1;
    } catch (const arena_exhausted &e) {
        safe_log(std::string("grouped aggregation out of buffer space: ") + e.what()
                 + " (raise --group-arena-bytes or use --strategy per-key)");
        return 1;
    } catch (const run_interrupted &e) {
        safe_log(std::string("interrupted: ") + e.what() + "; no report written");
        return 1;
    } catch (const std::bad_alloc &e) {
        safe_log(std::string("out of memory: ") + e.what());
        return 1;
    } catch (const std::exception &e) {
        safe_log(std::string("run failed: ") + e.what());
        return 1;
    }

    if (g_terminate.load()) {
        safe_log("interrupted after the run completed");
    }
    for (const auto &s : report.strategies) {
        safe_log(std::string(strategy_name(s.strategy)) + ": " + std::to_string(s.lines.size())
                 + " report lines in " + s.sink_dir);
    }
    if (!report.results_match) {
        safe_log("LocTally finished with diverging strategy results.");
        return 2;
    }
    safe_log("LocTally finished normally.");
    return 0;
}

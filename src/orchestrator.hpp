#pragma once
#include "aggregator.hpp"
#include "config.hpp"
#include <cstdint>
#include <string>
#include <vector>

struct StrategyReport {
    Strategy strategy = Strategy::PerKey; // PerKey or Grouped
    std::string sink_dir;
    std::vector<std::string> lines;
    AggregationResult counts;
    AggregationStats stats;
    int64_t elapsed_ms = 0;               // aggregation stage only
};

struct RunReport {
    uint64_t records_read = 0;
    size_t sampled = 0;
    std::vector<StrategyReport> strategies;
    bool results_match = true;            // meaningful when both strategies ran
    std::vector<std::string> mismatches;
};

// source -> sampler -> strategy -> formatter -> sink. Any failure propagates
// as an exception before a single report is written.
class Orchestrator {
public:
    explicit Orchestrator(Config cfg);

    // Streams the configured input through the reservoir in one pass.
    SampledSet sample_input(uint64_t *records_read = nullptr);

    // Runs the configured strategies on the sample; no I/O.
    RunReport aggregate(const SampledSet &sampled);

    // Persists every strategy report to its sink.
    void commit(const RunReport &report);

    RunReport run();

    const Config &config() const noexcept { return cfg_; }

private:
    StrategyReport run_per_key(const SampledSet &sampled);
    StrategyReport run_grouped(const SampledSet &sampled);

    Config cfg_;
};

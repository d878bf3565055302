#include "orchestrator.hpp"
#include "directory_sink.hpp"
#include "errors.hpp"
#include "formatter.hpp"
#include "global_ctl.hpp"
#include "grouped_aggregator.hpp"
#include "line_source.hpp"
#include "per_key_counter.hpp"
#include "sampler.hpp"
#include "util_log.hpp"
#include <chrono>

using Clock = std::chrono::steady_clock;

static int64_t millis_since(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
}

Orchestrator::Orchestrator(Config cfg) : cfg_(std::move(cfg)) {}

SampledSet Orchestrator::sample_input(uint64_t *records_read) {
    uint64_t seed = cfg_.seed_set ? cfg_.seed : random_seed();
    ReservoirSampler sampler(cfg_.sample_bound, seed);
    LineSource source(cfg_.input);

    safe_log("STEP: sampling " + cfg_.input + " (bound " + std::to_string(cfg_.sample_bound) + ")");
    uint64_t n = source.for_each_line([&sampler](std::string &&line) {
        sampler.offer(std::move(line));
    });
    SampledSet sampled = sampler.take();
    safe_log("OK: read " + std::to_string(n) + " records, kept " + std::to_string(sampled.size()));
    if (records_read) *records_read = n;
    return sampled;
}

StrategyReport Orchestrator::run_per_key(const SampledSet &sampled) {
    StrategyReport r;
    r.strategy = Strategy::PerKey;
    r.sink_dir = cfg_.output + "good/";

    PerKeyCounter counter(cfg_.workers, cfg_.qcap);
    auto start = Clock::now();
    r.counts = counter.aggregate(sampled);
    r.elapsed_ms = millis_since(start);
    r.stats = counter.stats();
    r.lines = format_per_key(r.counts);
    return r;
}

StrategyReport Orchestrator::run_grouped(const SampledSet &sampled) {
    StrategyReport r;
    r.strategy = Strategy::Grouped;
    r.sink_dir = cfg_.output + "bad/";

    GroupedAggregator grouped(cfg_.workers, cfg_.reducers, cfg_.qcap, cfg_.group_arena_bytes);
    auto start = Clock::now();
    GroupedResult g = grouped.aggregate_grouped(sampled);
    r.elapsed_ms = millis_since(start);
    r.stats = grouped.stats();
    r.counts = flatten(g);
    r.lines = format_grouped(g);
    return r;
}

RunReport Orchestrator::aggregate(const SampledSet &sampled) {
    RunReport report;
    report.sampled = sampled.size();

    if (cfg_.strategy == Strategy::PerKey || cfg_.strategy == Strategy::Both) {
        safe_log("STEP: per-key aggregation");
        report.strategies.push_back(run_per_key(sampled));
        const auto &r = report.strategies.back();
        safe_log("OK: per-key pipeline runs in " + std::to_string(r.elapsed_ms) + " ms; " + describe_stats(r.stats));
    }
    if (cfg_.strategy == Strategy::Grouped || cfg_.strategy == Strategy::Both) {
        safe_log("STEP: grouped aggregation");
        report.strategies.push_back(run_grouped(sampled));
        const auto &r = report.strategies.back();
        safe_log("OK: grouped pipeline runs in " + std::to_string(r.elapsed_ms) + " ms; " + describe_stats(r.stats));
    }

    if (report.strategies.size() == 2) {
        const auto &good = report.strategies[0];
        const auto &bad = report.strategies[1];
        safe_log("grouped pipeline is slower by " + std::to_string(bad.elapsed_ms - good.elapsed_ms) + " ms");
        report.mismatches = diff_results(good.counts, bad.counts);
        report.results_match = report.mismatches.empty();
        if (!report.results_match) {
            safe_log("strategies disagree on " + std::to_string(report.mismatches.size()) + " key(s) (a=per-key, b=grouped):");
            for (const auto &m : report.mismatches) safe_log("  " + m);
        }
    }
    return report;
}

void Orchestrator::commit(const RunReport &report) {
    std::vector<DirectorySink> written;
    try {
        for (const auto &r : report.strategies) {
            DirectorySink sink(r.sink_dir);
            sink.write(r.lines);
            written.push_back(sink);
        }
    } catch (const sink_write_failure &) {
        // all reports or none
        for (auto &w : written) w.discard();
        throw;
    }
}

RunReport Orchestrator::run() {
    safe_log("Run options: " + describe_config(cfg_));
    uint64_t read = 0;
    SampledSet sampled = sample_input(&read);
    RunReport report = aggregate(sampled);
    report.records_read = read;
    if (g_terminate.load()) throw run_interrupted("interrupted before the reports were written");
    commit(report);
    return report;
}

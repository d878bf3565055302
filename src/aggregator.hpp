#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "parser.hpp"
#include "sampler.hpp"

// valid key -> number of records carrying it
using AggregationResult = std::unordered_map<CompositeKey, uint64_t, CompositeKeyHash>;

// Counters describing one aggregation run. Fields that a strategy does not
// track stay zero.
struct AggregationStats {
    uint64_t records = 0;          // sampled records processed
    uint64_t valid = 0;            // records that produced a valid key
    uint64_t invalid = 0;          // malformed or rejected records
    size_t workers = 0;

    // per-key strategy
    size_t partitions_merged = 0;  // partial maps folded by the combine step
    size_t max_partition_keys = 0; // distinct keys held by the largest partition

    // grouped strategy
    uint64_t pairs_shuffled = 0;   // (location, subject) pairs moved to reducers
    size_t reducers = 0;
    size_t groups = 0;             // distinct locations
    size_t peak_group_bytes = 0;   // arena bytes of the largest location group
    size_t peak_group_subjects = 0;
    std::string peak_group_location;
};

// target[k] += source[k] for every k; associative and commutative.
void merge_counts(AggregationResult &target, const AggregationResult &source);
void merge_counts(AggregationResult &target, AggregationResult &&source);

uint64_t total_count(const AggregationResult &r) noexcept;

// Keys whose counts differ between a and b (missing counts as 0), as
// "<token> a=<n> b=<m>" lines. Empty when the mappings are identical.
std::vector<std::string> diff_results(const AggregationResult &a, const AggregationResult &b, size_t max_lines = 20);

std::string describe_stats(const AggregationStats &s);

#pragma once
#include "aggregator.hpp"
#include <utility>

struct LocationGroup {
    std::string location;
    // subject -> count, in order of first appearance within the group
    std::vector<std::pair<std::string, uint64_t>> subjects;
};

using GroupedResult = std::vector<LocationGroup>;

// Strategy B, kept for comparison with PerKeyCounter. Mappers pair each
// record's location code with its subject and shuffle the pair to the reducer
// owning that location. Nothing is counted until every mapper is done and
// each reducer has materialized the complete subject list of each of its
// locations in a SubjectArena; a hot location therefore pins all its subjects
// in one reducer at once. group_arena_bytes bounds one location's list
// (0 = unbounded); exceeding it throws arena_exhausted.
class GroupedAggregator {
public:
    GroupedAggregator(size_t workers, size_t reducers, size_t queue_capacity, size_t group_arena_bytes);

    // same (location, subject) -> count mapping as PerKeyCounter::aggregate
    AggregationResult aggregate(const SampledSet &sampled);

    GroupedResult aggregate_grouped(const SampledSet &sampled);

    const AggregationStats &stats() const noexcept { return stats_; }

private:
    size_t workers_;
    size_t reducers_;
    size_t queue_capacity_;
    size_t group_arena_bytes_;
    AggregationStats stats_;
};

AggregationResult flatten(const GroupedResult &grouped);

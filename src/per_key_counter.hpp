#pragma once
#include "aggregator.hpp"

// Strategy A: every worker counts composite keys of the records it pops into
// a private map (local combine). Partial maps travel as messages to a single
// fold on the calling thread, so no counter map is ever shared and memory per
// worker is bounded by the distinct keys of its own partition.
class PerKeyCounter {
public:
    PerKeyCounter(size_t workers, size_t queue_capacity);

    AggregationResult aggregate(const SampledSet &sampled);

    const AggregationStats &stats() const noexcept { return stats_; }

private:
    size_t workers_;
    size_t queue_capacity_;
    AggregationStats stats_;
};

#include "per_key_counter.hpp"
#include "bounded_queue.hpp"
#include "worker_pool.hpp"
#include "util_log.hpp"
#include <algorithm>

namespace {

struct PartialCounts {
    AggregationResult counts;
    uint64_t valid = 0;
    uint64_t invalid = 0;
};

} // namespace

PerKeyCounter::PerKeyCounter(size_t workers, size_t queue_capacity)
    : workers_(workers == 0 ? 1 : workers), queue_capacity_(queue_capacity == 0 ? 1 : queue_capacity)
{
}

AggregationResult PerKeyCounter::aggregate(const SampledSet &sampled) {
    stats_ = AggregationStats{};
    stats_.workers = workers_;

    BoundedQueue<std::string> records(queue_capacity_);
    // one slot per worker: a drain never blocks on the combine step
    BoundedQueue<PartialCounts> partials(workers_);
    std::vector<PartialCounts> local(workers_);

    WorkerPool pool(workers_, records,
        [&local](size_t w, const std::string &line) {
            auto key = composite_key_of(line);
            if (!key) {
                ++local[w].invalid;
                return;
            }
            ++local[w].valid;
            local[w].counts[std::move(*key)] += 1;
        },
        [&local, &partials](size_t w) {
            partials.push(std::move(local[w]));
        });

    for (const auto &r : sampled) {
        if (!records.push(r)) break; // closed by a failing or interrupted worker
    }
    records.close();
    pool.join();
    partials.close();

    AggregationResult merged;
    PartialCounts p;
    while (partials.pop(p)) {
        stats_.partitions_merged += 1;
        stats_.max_partition_keys = std::max(stats_.max_partition_keys, p.counts.size());
        stats_.valid += p.valid;
        stats_.invalid += p.invalid;
        merge_counts(merged, std::move(p.counts));
        p = PartialCounts{};
    }
    stats_.records = stats_.valid + stats_.invalid;

    safe_log("per-key: merged " + std::to_string(stats_.partitions_merged) + " partial maps into "
             + std::to_string(merged.size()) + " keys");
    return merged;
}

#include "grouped_aggregator.hpp"
#include "bounded_queue.hpp"
#include "subject_arena.hpp"
#include "worker_pool.hpp"
#include "util_log.hpp"
#include <exception>
#include <functional>
#include <thread>
#include <unordered_map>

namespace {

using SubjectPair = std::pair<std::string, std::string>; // (location, subject)
using Outbox = std::vector<SubjectPair>;

struct MapperState {
    std::vector<Outbox> outboxes; // one per reducer
    uint64_t valid = 0;
    uint64_t invalid = 0;
};

struct ReducerOutput {
    GroupedResult groups;
    size_t peak_bytes = 0;
    size_t peak_subjects = 0;
    std::string peak_location;
};

size_t reducer_for(const std::string &location, size_t reducers) {
    return std::hash<std::string>{}(location) % reducers;
}

// Counts one fully materialized group. A subject seen for the first time
// starts at zero and is then incremented like any other occurrence.
LocationGroup count_group(const std::string &location, const SubjectArena &arena) {
    LocationGroup g;
    g.location = location;
    std::unordered_map<std::string, size_t> slot;
    arena.for_each([&](std::string_view s) {
        auto ins = slot.try_emplace(std::string(s), g.subjects.size());
        if (ins.second) g.subjects.emplace_back(ins.first->first, 0);
        g.subjects[ins.first->second].second += 1;
    });
    return g;
}

void run_reducer(size_t r, std::vector<MapperState> &mappers, size_t arena_bytes, ReducerOutput &out) {
    std::unordered_map<std::string, SubjectArena> groups;
    std::vector<std::string> order;

    // gather: every value of a location is co-located before counting starts
    for (auto &m : mappers) {
        Outbox box;
        box.swap(m.outboxes[r]);
        for (auto &p : box) {
            auto it = groups.find(p.first);
            if (it == groups.end()) {
                it = groups.emplace(p.first, SubjectArena(arena_bytes)).first;
                order.push_back(p.first);
            }
            it->second.append(p.second);
        }
    }

    for (const auto &loc : order) {
        const SubjectArena &arena = groups.at(loc);
        if (arena.bytes_used() > out.peak_bytes) {
            out.peak_bytes = arena.bytes_used();
            out.peak_subjects = arena.count();
            out.peak_location = loc;
        }
        out.groups.push_back(count_group(loc, arena));
    }
}

} // namespace

GroupedAggregator::GroupedAggregator(size_t workers, size_t reducers, size_t queue_capacity, size_t group_arena_bytes)
    : workers_(workers == 0 ? 1 : workers),
      reducers_(reducers == 0 ? 1 : reducers),
      queue_capacity_(queue_capacity == 0 ? 1 : queue_capacity),
      group_arena_bytes_(group_arena_bytes)
{
}

GroupedResult GroupedAggregator::aggregate_grouped(const SampledSet &sampled) {
    stats_ = AggregationStats{};
    stats_.workers = workers_;
    stats_.reducers = reducers_;

    std::vector<MapperState> mappers(workers_);
    for (auto &m : mappers) m.outboxes.resize(reducers_);

    // map + shuffle
    {
        BoundedQueue<std::string> records(queue_capacity_);
        const size_t reducers = reducers_;
        WorkerPool pool(workers_, records,
            [&mappers, reducers](size_t w, const std::string &line) {
                ExtractedFields f = extract_fields(line);
                if (!build_key(f)) {
                    ++mappers[w].invalid;
                    return;
                }
                ++mappers[w].valid;
                size_t r = reducer_for(f.location, reducers);
                mappers[w].outboxes[r].emplace_back(std::move(f.location), std::move(f.subject));
            });

        for (const auto &rec : sampled) {
            if (!records.push(rec)) break;
        }
        records.close();
        pool.join(); // barrier: no reducer starts before the shuffle is complete
    }

    for (const auto &m : mappers) {
        stats_.valid += m.valid;
        stats_.invalid += m.invalid;
        for (const auto &box : m.outboxes) stats_.pairs_shuffled += box.size();
    }
    stats_.records = stats_.valid + stats_.invalid;

    // group + count
    std::vector<ReducerOutput> outputs(reducers_);
    std::vector<std::exception_ptr> errors(reducers_);
    std::vector<std::thread> threads;
    threads.reserve(reducers_);
    try {
        for (size_t r = 0; r < reducers_; ++r) {
            threads.emplace_back([&, r]() {
                try {
                    run_reducer(r, mappers, group_arena_bytes_, outputs[r]);
                } catch (const std::exception &ex) {
                    safe_log(std::string("grouped: reducer ") + std::to_string(r) + " failed: " + ex.what());
                    errors[r] = std::current_exception();
                } catch (...) {
                    safe_log(std::string("grouped: reducer ") + std::to_string(r) + " failed: unknown exception");
                    errors[r] = std::current_exception();
                }
            });
        }
    } catch (...) {
        for (auto &t : threads) t.join();
        throw;
    }
    for (auto &t : threads) t.join();
    for (auto &ep : errors) {
        if (ep) std::rethrow_exception(ep);
    }

    GroupedResult result;
    for (auto &o : outputs) {
        if (o.peak_bytes > stats_.peak_group_bytes) {
            stats_.peak_group_bytes = o.peak_bytes;
            stats_.peak_group_subjects = o.peak_subjects;
            stats_.peak_group_location = o.peak_location;
        }
        for (auto &g : o.groups) result.push_back(std::move(g));
    }
    stats_.groups = result.size();

    safe_log("grouped: " + std::to_string(stats_.pairs_shuffled) + " pairs shuffled into "
             + std::to_string(stats_.groups) + " location groups; largest group "
             + (stats_.peak_group_location.empty() ? std::string("-") : stats_.peak_group_location)
             + " holds " + std::to_string(stats_.peak_group_bytes) + " bytes");
    return result;
}

AggregationResult GroupedAggregator::aggregate(const SampledSet &sampled) {
    return flatten(aggregate_grouped(sampled));
}

AggregationResult flatten(const GroupedResult &grouped) {
    AggregationResult out;
    for (const auto &g : grouped) {
        for (const auto &s : g.subjects) out[CompositeKey{g.location, s.first}] += s.second;
    }
    return out;
}

#include "aggregator.hpp"
#include <sstream>

void merge_counts(AggregationResult &target, const AggregationResult &source) {
    for (const auto &kv : source) target[kv.first] += kv.second;
}

void merge_counts(AggregationResult &target, AggregationResult &&source) {
    if (target.empty()) {
        target.swap(source);
        return;
    }
    // fold the smaller map into the larger one
    if (target.size() < source.size()) target.swap(source);
    for (auto &kv : source) target[kv.first] += kv.second;
    source.clear();
}

uint64_t total_count(const AggregationResult &r) noexcept {
    uint64_t sum = 0;
    for (const auto &kv : r) sum += kv.second;
    return sum;
}

std::vector<std::string> diff_results(const AggregationResult &a, const AggregationResult &b, size_t max_lines) {
    std::vector<std::string> out;
    auto note = [&](const CompositeKey &k, uint64_t va, uint64_t vb) {
        if (out.size() >= max_lines) return;
        out.push_back(key_token(k) + " a=" + std::to_string(va) + " b=" + std::to_string(vb));
    };
    for (const auto &kv : a) {
        auto it = b.find(kv.first);
        uint64_t vb = (it == b.end()) ? 0 : it->second;
        if (vb != kv.second) note(kv.first, kv.second, vb);
    }
    for (const auto &kv : b) {
        if (a.find(kv.first) == a.end()) note(kv.first, 0, kv.second);
    }
    return out;
}

std::string describe_stats(const AggregationStats &s) {
    std::ostringstream os;
    os << "records=" << s.records << " valid=" << s.valid << " invalid=" << s.invalid
       << " workers=" << s.workers;
    if (s.partitions_merged > 0) {
        os << " partitions_merged=" << s.partitions_merged
           << " max_partition_keys=" << s.max_partition_keys;
    }
    if (s.reducers > 0) {
        os << " reducers=" << s.reducers
           << " pairs_shuffled=" << s.pairs_shuffled
           << " groups=" << s.groups
           << " peak_group=" << (s.peak_group_location.empty() ? "-" : s.peak_group_location)
           << " peak_group_subjects=" << s.peak_group_subjects
           << " peak_group_bytes=" << s.peak_group_bytes;
    }
    return os.str();
}

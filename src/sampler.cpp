#include "sampler.hpp"
#include <algorithm>

// reserve at most this many slots up front; huge bounds grow on demand
static const size_t MAX_RESERVE = 1 << 16;

ReservoirSampler::ReservoirSampler(size_t bound, uint64_t seed)
    : bound_(bound), seen_(0), rng_(seed)
{
    reservoir_.reserve(std::min(bound_, MAX_RESERVE));
}

void ReservoirSampler::offer(std::string record) {
    ++seen_;
    if (reservoir_.size() < bound_) {
        reservoir_.push_back(std::move(record));
        return;
    }
    if (bound_ == 0) return;
    std::uniform_int_distribution<uint64_t> dist(0, seen_ - 1);
    uint64_t idx = dist(rng_);
    if (idx < bound_) reservoir_[static_cast<size_t>(idx)] = std::move(record);
}

SampledSet ReservoirSampler::take() {
    SampledSet out;
    out.swap(reservoir_);
    seen_ = 0;
    return out;
}

SampledSet reservoir_sample(const std::vector<std::string> &records, size_t bound, uint64_t seed) {
    ReservoirSampler s(bound, seed);
    for (const auto &r : records) s.offer(r);
    return s.take();
}

uint64_t random_seed() {
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) ^ rd();
}

#pragma once
#include <cstdint>
#include <random>
#include <string>
#include <vector>

using SampledSet = std::vector<std::string>;

// Uniform fixed-size sample of a stream of unknown length (Algorithm R).
// While fewer than `bound` records have been offered the reservoir holds all
// of them in arrival order; afterwards record n replaces a random slot with
// probability bound/n.
class ReservoirSampler {
public:
    ReservoirSampler(size_t bound, uint64_t seed);

    void offer(std::string record);

    size_t bound() const noexcept { return bound_; }
    size_t size() const noexcept { return reservoir_.size(); }
    uint64_t seen() const noexcept { return seen_; }

    // Moves the sample out; the sampler is empty afterwards.
    SampledSet take();

private:
    size_t bound_;
    uint64_t seen_;
    std::mt19937_64 rng_;
    SampledSet reservoir_;
};

SampledSet reservoir_sample(const std::vector<std::string> &records, size_t bound, uint64_t seed);

// seed drawn from std::random_device
uint64_t random_seed();

// tests/test_sampler.cpp
#include <iostream>
#include <set>
#include <string>
#include <vector>
#include "../src/sampler.hpp"

int main() {
    std::vector<std::string> input;
    for (int i = 0; i < 100; ++i) input.push_back("r" + std::to_string(i));

    // smaller than the bound: everything, unchanged
    auto all = reservoir_sample(input, 10000, 7);
    if (all != input) {
        std::cerr << "sampler: input below bound should come back unchanged\n";
        return 2;
    }
    auto again = reservoir_sample(input, 10000, 99);
    if (again != input) {
        std::cerr << "sampler: re-run below bound should be identical\n";
        return 3;
    }

    auto some = reservoir_sample(input, 10, 42);
    if (some.size() != 10) {
        std::cerr << "sampler: expected 10 got " << some.size() << "\n";
        return 4;
    }
    std::set<std::string> uniq(some.begin(), some.end());
    if (uniq.size() != 10) {
        std::cerr << "sampler: duplicate records in sample\n";
        return 5;
    }
    for (const auto &s : some) {
        if (s.empty() || s[0] != 'r') {
            std::cerr << "sampler: foreign record " << s << "\n";
            return 6;
        }
    }

    if (!reservoir_sample(input, 0, 1).empty()) {
        std::cerr << "sampler: bound 0 should give an empty sample\n";
        return 7;
    }

    // every record kept with probability k/n: 10 items, k=5, 20000 runs -> ~10000 each
    std::vector<std::string> ten;
    for (int i = 0; i < 10; ++i) ten.push_back(std::to_string(i));
    std::vector<int> hits(10, 0);
    for (uint64_t seed = 0; seed < 20000; ++seed) {
        for (const auto &s : reservoir_sample(ten, 5, seed)) hits[std::stoi(s)]++;
    }
    for (int i = 0; i < 10; ++i) {
        if (hits[i] < 9000 || hits[i] > 11000) {
            std::cerr << "sampler: record " << i << " selected " << hits[i] << " times, expected ~10000\n";
            return 8;
        }
    }

    ReservoirSampler rs(3, 5);
    for (int i = 0; i < 50; ++i) rs.offer(std::to_string(i));
    if (rs.seen() != 50 || rs.size() != 3 || rs.take().size() != 3 || rs.size() != 0) {
        std::cerr << "sampler: streaming counters mismatch\n";
        return 9;
    }

    std::cout << "test_sampler: OK\n";
    return 0;
}

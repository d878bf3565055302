// tests/test_subject_arena.cpp
#include <iostream>
#include <string>
#include <vector>

#include "../src/errors.hpp"
#include "../src/subject_arena.hpp"

int main() {
    SubjectArena a(0, 64);
    std::vector<std::string> in;
    for (int i = 0; i < 200; ++i) in.push_back("subject-" + std::to_string(i));
    in.push_back("");
    for (const auto &s : in) a.append(s);

    std::vector<std::string> out;
    a.for_each([&](std::string_view s) { out.emplace_back(s); });
    if (out != in) {
        std::cerr << "arena: entries not returned in insertion order\n";
        return 2;
    }
    if (a.count() != in.size() || a.blocks() < 2) {
        std::cerr << "arena: expected " << in.size() << " entries over several blocks, got "
                  << a.count() << " in " << a.blocks() << "\n";
        return 3;
    }

    // an entry larger than a block gets its own block
    SubjectArena big(0, 64);
    std::string huge(1000, 'z');
    big.append("a");
    big.append(huge);
    big.append("b");
    std::vector<std::string> seen;
    big.for_each([&](std::string_view s) { seen.emplace_back(s); });
    if (seen.size() != 3 || seen[1] != huge || seen[2] != "b") {
        std::cerr << "arena: oversized entry mishandled\n";
        return 4;
    }

    // budget of 3 entries of "abcd" (4 + 4 bytes each)
    SubjectArena bounded(24, 64);
    bounded.append("abcd");
    bounded.append("abcd");
    bounded.append("abcd");
    bool threw = false;
    try {
        bounded.append("abcd");
    } catch (const arena_exhausted &) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "arena: append past capacity should throw arena_exhausted\n";
        return 5;
    }
    if (bounded.bytes_used() != 24 || bounded.count() != 3) {
        std::cerr << "arena: failed append must not change the arena\n";
        return 6;
    }

    bounded.clear();
    if (bounded.count() != 0 || bounded.bytes_used() != 0) {
        std::cerr << "arena: clear did not reset\n";
        return 7;
    }
    bounded.append("abcd");

    std::cout << "test_subject_arena: OK\n";
    return 0;
}

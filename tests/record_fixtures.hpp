// tests/record_fixtures.hpp
// Builds GDELT-shaped event rows for the tests.
#pragma once
#include <string>
#include <vector>

// 23 tab-separated fields: subject at index 6, location at index 21.
inline std::string make_record(const std::string &location, const std::string &subject) {
    std::vector<std::string> f(23, "x");
    f[0] = "a"; f[1] = "b"; f[2] = "c"; f[3] = "d"; f[4] = "e"; f[5] = "f";
    f[6] = subject;
    f[21] = location;
    f[22] = "...";
    std::string s;
    for (size_t i = 0; i < f.size(); ++i) {
        if (i) s += '\t';
        s += f[i];
    }
    return s;
}

inline std::string malformed_record() {
    return "a\tb\tc\td\te";
}

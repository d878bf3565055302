#include "formatter.hpp"

std::vector<std::string> format_per_key(const AggregationResult &result) {
    std::vector<std::string> lines;
    lines.reserve(result.size());
    for (const auto &kv : result) {
        std::string s;
        s.reserve(kv.first.location.size() + kv.first.subject.size() + 24);
        s.append(kv.first.location).append(1, ' ')
         .append(kv.first.subject).append(1, ' ')
         .append(std::to_string(kv.second));
        lines.push_back(std::move(s));
    }
    return lines;
}

std::vector<std::string> format_grouped(const GroupedResult &grouped) {
    std::vector<std::string> lines;
    lines.reserve(grouped.size());
    for (const auto &g : grouped) {
        std::string s = g.location;
        for (const auto &p : g.subjects) {
            s.append(1, ' ').append(p.first).append(1, ' ').append(std::to_string(p.second));
        }
        lines.push_back(std::move(s));
    }
    return lines;
}

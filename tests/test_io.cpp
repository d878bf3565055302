// tests/test_io.cpp
// LineSource and DirectorySink against the local filesystem.

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "../src/directory_sink.hpp"
#include "../src/errors.hpp"
#include "../src/line_source.hpp"

namespace fs = std::filesystem;

int main() {
    fs::path dir = fs::temp_directory_path() / "loctally_test_io";
    fs::remove_all(dir);
    fs::create_directories(dir);

    // CRLF input: '\r' is not part of the record
    fs::path in = dir / "in.tsv";
    {
        std::ofstream o(in, std::ios::binary);
        o << "one\r\ntwo\nthree";
    }
    std::vector<std::string> lines;
    LineSource src(in.string());
    uint64_t n = src.for_each_line([&](std::string &&l) { lines.push_back(std::move(l)); });
    if (n != 3 || lines.size() != 3 || lines[0] != "one" || lines[1] != "two" || lines[2] != "three") {
        std::cerr << "io: line source mismatch\n";
        return 2;
    }

    auto unavailable = [](const std::string &path) {
        try {
            LineSource(path).for_each_line([](std::string &&) {});
        } catch (const source_unavailable &) {
            return true;
        }
        return false;
    };
    if (!unavailable((dir / "missing.tsv").string())) {
        std::cerr << "io: missing file should be source_unavailable\n";
        return 3;
    }
    if (!unavailable("http://data.gdeltproject.org/events/20170115.export.CSV.zip")) {
        std::cerr << "io: remote input should be source_unavailable\n";
        return 4;
    }
    if (!unavailable((dir / "x.export.CSV.zip").string()) || !unavailable("")) {
        std::cerr << "io: zip or empty input should be source_unavailable\n";
        return 5;
    }

    // sink writes the part file and leaves no temporary behind
    DirectorySink sink((dir / "outgood/").string());
    sink.write({"US SUBJ1 3", "FR 042 1"});
    std::ifstream part(sink.part_path());
    std::string l1, l2, l3;
    std::getline(part, l1);
    std::getline(part, l2);
    if (l1 != "US SUBJ1 3" || l2 != "FR 042 1" || std::getline(part, l3)) {
        std::cerr << "io: sink content mismatch\n";
        return 6;
    }
    if (fs::exists(sink.part_path() + ".tmp")) {
        std::cerr << "io: temporary file left behind\n";
        return 7;
    }
    sink.discard();
    if (fs::exists(sink.part_path())) {
        std::cerr << "io: discard did not remove the report\n";
        return 8;
    }

    // a regular file where the directory should go
    fs::path blocker = dir / "blocker";
    { std::ofstream o(blocker); o << "x"; }
    bool threw = false;
    try {
        DirectorySink((blocker / "good").string()).write({"line"});
    } catch (const sink_write_failure &) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "io: expected sink_write_failure\n";
        return 9;
    }

    fs::remove_all(dir);
    std::cout << "test_io: OK\n";
    return 0;
}

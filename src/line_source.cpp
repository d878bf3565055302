#include "line_source.hpp"
#include "errors.hpp"
#include "global_ctl.hpp"
#include "util_log.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>

bool looks_remote(const std::string &path) {
    return path.find("://") != std::string::npos;
}

static bool ends_with(const std::string &s, const std::string &suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

LineSource::LineSource(std::string path) : path_(std::move(path)) {}

static uint64_t drain_stream(std::istream &in, const std::string &name,
                             const std::function<void(std::string &&)> &fn) {
    uint64_t n = 0;
    std::string line;
    while (!g_terminate.load() && std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        ++n;
        fn(std::move(line));
        line.clear();
    }
    if (g_terminate.load()) throw run_interrupted("interrupted while reading " + name);
    if (in.bad()) throw source_unavailable("read error on " + name);
    return n;
}

uint64_t LineSource::for_each_line(const std::function<void(std::string &&)> &fn) {
    if (path_.empty()) throw source_unavailable("no input configured");
    if (path_ == "-") return drain_stream(std::cin, "<stdin>", fn);
    if (looks_remote(path_)) {
        throw source_unavailable("remote input not supported, fetch it locally first: " + path_);
    }
    if (ends_with(path_, ".zip") || ends_with(path_, ".ZIP")) {
        throw source_unavailable("compressed input not supported, unzip it first: " + path_);
    }

    std::ifstream in(path_, std::ios::in);
    if (!in) {
        throw source_unavailable("failed to open " + path_ + ": " + std::strerror(errno));
    }
    safe_log("source: reading " + path_);
    return drain_stream(in, path_, fn);
}

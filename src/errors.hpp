#pragma once
#include <stdexcept>
#include <string>

// Fatal conditions. Malformed records and invalid keys are not errors; they
// are filtered where they are produced.

// Input cannot be opened or read.
class source_unavailable : public std::runtime_error {
public:
    explicit source_unavailable(const std::string &what) : std::runtime_error(what) {}
};

// Report could not be persisted. No final output file is left behind.
class sink_write_failure : public std::runtime_error {
public:
    explicit sink_write_failure(const std::string &what) : std::runtime_error(what) {}
};

// A location group outgrew its SubjectArena budget.
class arena_exhausted : public std::runtime_error {
public:
    explicit arena_exhausted(const std::string &what) : std::runtime_error(what) {}
};

// Bad command line.
class config_error : public std::runtime_error {
public:
    explicit config_error(const std::string &what) : std::runtime_error(what) {}
};

// Run aborted by SIGINT before the aggregation finished.
class run_interrupted : public std::runtime_error {
public:
    explicit run_interrupted(const std::string &what) : std::runtime_error(what) {}
};

#pragma once
#include <cstdint>
#include <functional>
#include <string>

// Streams raw records from a local file, or stdin when the path is "-".
// Remote locations ("scheme://...") and .zip archives are not readable here
// and are reported as source_unavailable, as is a file that cannot be opened.
class LineSource {
public:
    explicit LineSource(std::string path);

    const std::string &path() const noexcept { return path_; }

    // Calls fn for every record (trailing '\r' stripped). Returns the number
    // of records read. Throws source_unavailable on open or read failure.
    uint64_t for_each_line(const std::function<void(std::string &&)> &fn);

private:
    std::string path_;
};

bool looks_remote(const std::string &path);

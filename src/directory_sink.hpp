#pragma once
#include <string>
#include <vector>

// Writes a report as <dir>/part-00000-of-00001. The lines go to a temporary
// file that is renamed into place only once fully flushed, so a failed write
// never leaves a partial report behind.
class DirectorySink {
public:
    explicit DirectorySink(std::string dir);

    const std::string &dir() const noexcept { return dir_; }
    std::string part_path() const;

    // Throws sink_write_failure.
    void write(const std::vector<std::string> &lines);

    // Removes a report written earlier; missing files are not an error.
    void discard() noexcept;

private:
    std::string dir_;
};

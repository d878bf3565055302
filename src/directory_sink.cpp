#include "directory_sink.hpp"
#include "errors.hpp"
#include "util_log.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

static const char *PART_NAME = "part-00000-of-00001";

DirectorySink::DirectorySink(std::string dir) : dir_(std::move(dir)) {}

std::string DirectorySink::part_path() const {
    return (fs::path(dir_) / PART_NAME).string();
}

void DirectorySink::write(const std::vector<std::string> &lines) {
    std::error_code ec;
    fs::create_directories(fs::path(dir_), ec);
    if (ec) throw sink_write_failure("cannot create " + dir_ + ": " + ec.message());

    const std::string final_path = part_path();
    const std::string tmp = final_path + ".tmp";
    {
        std::ofstream o(tmp, std::ios::out | std::ios::trunc);
        if (!o) throw sink_write_failure("cannot open " + tmp);
        for (const auto &l : lines) o << l << '\n';
        o.flush();
        if (!o) {
            o.close();
            std::remove(tmp.c_str());
            throw sink_write_failure("write failed on " + tmp);
        }
    }

    if (std::rename(tmp.c_str(), final_path.c_str()) != 0) {
        fs::rename(fs::path(tmp), fs::path(final_path), ec);
        if (ec) {
            std::remove(tmp.c_str());
            throw sink_write_failure("cannot move " + tmp + " to " + final_path + ": " + ec.message());
        }
    }
    safe_log("sink: wrote " + std::to_string(lines.size()) + " lines to " + final_path);
}

void DirectorySink::discard() noexcept {
    std::error_code ec;
    fs::remove(fs::path(part_path()), ec);
    if (ec) safe_log("sink: could not remove " + part_path() + ": " + ec.message());
}

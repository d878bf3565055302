#pragma once
#include <string>

// Serialized log writer: every message goes to stderr and is appended to the log file.
void safe_log(const std::string &s);

// Redirect the append-only log file (default "loctally.err.log"). Empty disables the file copy.
void set_log_file(const std::string &path);

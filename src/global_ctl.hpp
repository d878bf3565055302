#pragma once
#include <atomic>

// Process-wide termination flag (set by SIGINT). Defined once in main.cpp,
// and in tests/test_globals.cpp for the test executables.
extern std::atomic<bool> g_terminate;

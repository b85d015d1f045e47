#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/drift_errors.hpp"

namespace drift::exec {

inline constexpr int kTimeoutExitCode = 124;
inline constexpr int kRejectedExitCode = 126;
inline constexpr int kSpawnFailureExitCode = 127;

struct ProcessSpec {
    std::vector<std::string> argv;
    std::filesystem::path working_directory;  // Empty means inherit
    std::uint32_t timeout_ms = 300000;
};

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

// argv for a command line: direct exec when the text has no shell syntax,
// otherwise {"/bin/sh", "-c", command}.
core::errors::Result<std::vector<std::string>> command_argv(const std::string& command);

// Runs argv in its own process group with stdin from /dev/null, capturing
// both streams. On timeout the whole group is killed and exit_code is 124.
// A program that cannot be exec'd exits with 127.
core::errors::Result<ProcessCapture> run_process(const ProcessSpec& spec);

}  // namespace drift::exec

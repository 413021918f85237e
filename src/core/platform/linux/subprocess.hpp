#pragma once

#include "error.hpp"

#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace subprocess {

struct Result {
    int exit_code = 0;
    std::string output; // stdout, when captured
};

// Runs argv to completion, writing `input` to its stdin. CommandFailed if the
// program cannot be executed (exit 127 from the child).
std::expected<Result, Error> run(const std::vector<std::string>& argv,
                                 std::string_view input = {},
                                 bool capture_output = false);

// Starts argv without waiting for it; stdio goes to /dev/null.
std::expected<int, Error> spawn_detached(const std::vector<std::string>& argv);

// Starts one stage of a pipeline with the given descriptors as stdin/stdout
// (-1 means /dev/null). The child stays in the caller's process group.
std::expected<int, Error> spawn_stage(const std::vector<std::string>& argv, int stdin_fd, int stdout_fd);

// Blocks until pid exits; returns its exit code (128 + signal if killed).
std::expected<int, Error> wait_exit(int pid);

} // namespace subprocess

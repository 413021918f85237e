#pragma once

#include <string>

namespace platform {

std::string config_dir();
std::string data_dir();

// Per-login ephemeral directory holding the session record and lock file.
std::string runtime_dir();

// Path of the `dictate` CLI, which also runs the player child. Falls back
// to a $PATH lookup.
std::string cli_executable();

} // namespace platform

#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <filesystem>
#include <unistd.h>

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg) return std::string(xdg) + "/dictate";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/dictate";
}

std::string data_dir() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg) return std::string(xdg) + "/dictate";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.local/share/dictate";
}

std::string runtime_dir() {
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg) return std::string(xdg) + "/dictate";
    return "/tmp/dictate-" + std::to_string(::getuid());
}

std::string cli_executable() {
    std::error_code ec;
    auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) return "dictate";

    // The listener is installed next to the CLI.
    auto sibling = self.parent_path() / "dictate";
    if (std::filesystem::exists(sibling, ec)) return sibling.string();
    return "dictate";
}

} // namespace platform

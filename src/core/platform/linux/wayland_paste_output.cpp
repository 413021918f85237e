#include "platform/linux/wayland_paste_output.hpp"

#include "platform/linux/subprocess.hpp"

#include <unistd.h>

WaylandPasteOutput::WaylandPasteOutput(bool terminal_shortcut)
    : terminal_shortcut_(terminal_shortcut) {}

std::expected<void, Error> WaylandPasteOutput::deliver(const std::string& text) {
    auto clip = subprocess::run({"wl-copy"}, text);
    if (!clip) return std::unexpected(clip.error());
    if (clip->exit_code != 0) {
        return std::unexpected(Error{ErrorCode::CommandFailed,
                                     "wl-copy exited with code " + std::to_string(clip->exit_code)});
    }

    ::usleep(10000);

    std::vector<std::string> keys = terminal_shortcut_
        ? std::vector<std::string>{"wtype", "-M", "ctrl", "-M", "shift", "-k", "v"}
        : std::vector<std::string>{"wtype", "-M", "ctrl", "-k", "v"};

    auto paste = subprocess::run(keys);
    if (!paste) return std::unexpected(paste.error());
    if (paste->exit_code != 0) {
        // wtype fails when no surface has keyboard focus.
        return std::unexpected(Error{ErrorCode::NoFocusTarget,
                                     "wtype paste failed with code " + std::to_string(paste->exit_code)});
    }
    return {};
}

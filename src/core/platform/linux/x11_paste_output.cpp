#include "platform/linux/x11_paste_output.hpp"

#include "output/terminal_match.hpp"
#include "platform/linux/subprocess.hpp"

#include <unistd.h>

X11PasteOutput::X11PasteOutput(std::vector<std::string> terminals)
    : terminals_(std::move(terminals)) {}

std::expected<void, Error> X11PasteOutput::deliver(const std::string& text) {
    auto window = subprocess::run({"xdotool", "getactivewindow"}, {}, true);
    if (!window) return std::unexpected(window.error());
    auto wid = window->output.substr(0, window->output.find_first_of("\r\n"));
    if (window->exit_code != 0 || wid.empty()) {
        return std::unexpected(Error{ErrorCode::NoFocusTarget, "no active window to paste into"});
    }

    auto clip = subprocess::run({"xclip", "-selection", "clipboard"}, text);
    if (!clip) return std::unexpected(clip.error());
    if (clip->exit_code != 0) {
        return std::unexpected(Error{ErrorCode::CommandFailed,
                                     "xclip exited with code " + std::to_string(clip->exit_code)});
    }

    bool terminal = false;
    auto wm_class = subprocess::run({"xprop", "-id", wid, "WM_CLASS"}, {}, true);
    if (wm_class && wm_class->exit_code == 0) {
        terminal = is_terminal_class(parse_wm_class(wm_class->output), terminals_);
    }

    // Let xclip take ownership of the selection before pasting.
    ::usleep(50000);

    auto keys = terminal ? "ctrl+shift+v" : "ctrl+v";
    auto paste = subprocess::run({"xdotool", "key", "--clearmodifiers", keys});
    if (!paste) return std::unexpected(paste.error());
    if (paste->exit_code != 0) {
        return std::unexpected(Error{ErrorCode::CommandFailed,
                                     "xdotool paste failed with code " + std::to_string(paste->exit_code)});
    }
    return {};
}

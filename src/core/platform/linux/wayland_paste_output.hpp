#pragma once

#include "output/output.hpp"

// wl-copy + wtype. Wayland offers no portable focused-window query, so the
// terminal shortcut is chosen by configuration.
class WaylandPasteOutput : public OutputMethod {
public:
    explicit WaylandPasteOutput(bool terminal_shortcut = false);
    std::expected<void, Error> deliver(const std::string& text) override;

private:
    bool terminal_shortcut_;
};

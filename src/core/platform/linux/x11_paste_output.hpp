#pragma once

#include "output/output.hpp"

#include <string>
#include <vector>

// xclip + xdotool. Terminals get Ctrl+Shift+V, everything else Ctrl+V.
class X11PasteOutput : public OutputMethod {
public:
    explicit X11PasteOutput(std::vector<std::string> terminals);
    std::expected<void, Error> deliver(const std::string& text) override;

private:
    std::vector<std::string> terminals_;
};

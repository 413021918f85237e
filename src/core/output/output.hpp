#pragma once

#include "error.hpp"

#include <expected>
#include <string>

// Puts text on the clipboard and pastes it into the focused window.
class OutputMethod {
public:
    virtual ~OutputMethod() = default;
    virtual std::expected<void, Error> deliver(const std::string& text) = 0;
};

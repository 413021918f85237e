#pragma once

#include "error.hpp"

#include <expected>
#include <string>

// Speaks one paragraph and blocks until playback ends. Pause, resume and
// stop reach the engine as signals to the player's process group.
class SpeechEngine {
public:
    virtual ~SpeechEngine() = default;
    virtual std::expected<void, Error> speak(const std::string& paragraph) = 0;
};

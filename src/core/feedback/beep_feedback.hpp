#pragma once

#include "feedback.hpp"

#include <string>

// Plays short sine beeps through aplay; the WAVs are generated on first use
// into `dir`.
class BeepFeedback : public Feedback {
public:
    BeepFeedback(std::string dir, bool enabled);

    void cue(Cue c) override;

    static double frequency(Cue c);

private:
    std::string ensure_tone(Cue c);

    std::string dir_;
    bool enabled_;
};

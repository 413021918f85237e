#pragma once

// Audible cue played at the edges of a dictation.
enum class Cue { Start, Stop, Ready };

class Feedback {
public:
    virtual ~Feedback() = default;
    virtual void cue(Cue c) = 0;
};

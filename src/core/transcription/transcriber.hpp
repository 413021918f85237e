#pragma once

#include "error.hpp"

#include <expected>
#include <string>

struct TranscriptResult {
    std::string text;
    double duration_s = 0.0;
    double processing_s = 0.0;
};

// Speech-to-text provider. Fails with AuthError, NetworkError or EmptyAudio.
class Transcriber {
public:
    virtual ~Transcriber() = default;
    virtual std::expected<TranscriptResult, Error>
        transcribe(const std::string& audio_path, const std::string& credential) = 0;
};

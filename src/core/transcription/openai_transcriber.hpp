#pragma once

#include "transcriber.hpp"

#include <string>

// OpenAI-compatible /audio/transcriptions endpoint (Groq, OpenAI, or a local
// whisper server speaking the same API).
class OpenAiTranscriber : public Transcriber {
public:
    OpenAiTranscriber(std::string url, std::string model, std::string language = {},
                      long timeout_s = 120);
    ~OpenAiTranscriber() override;

    OpenAiTranscriber(const OpenAiTranscriber&) = delete;
    OpenAiTranscriber& operator=(const OpenAiTranscriber&) = delete;

    std::expected<TranscriptResult, Error>
        transcribe(const std::string& audio_path, const std::string& credential) override;

private:
    std::string url_;
    std::string model_;
    std::string language_;
    long timeout_s_;
};

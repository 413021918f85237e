#pragma once

#include "credentials/credential_store.hpp"
#include "speech_engine.hpp"

#include <string>

// Remote synthesis: OpenAI /v1/audio/speech, WAV streamed into aplay.
class OpenAiSpeechEngine : public SpeechEngine {
public:
    OpenAiSpeechEngine(std::string url, std::string model, std::string voice,
                       std::string credential_key, CredentialStore& credentials);
    ~OpenAiSpeechEngine() override;

    OpenAiSpeechEngine(const OpenAiSpeechEngine&) = delete;
    OpenAiSpeechEngine& operator=(const OpenAiSpeechEngine&) = delete;

    std::expected<void, Error> speak(const std::string& paragraph) override;

private:
    std::string url_;
    std::string model_;
    std::string voice_;
    std::string credential_key_;
    CredentialStore& credentials_;
};

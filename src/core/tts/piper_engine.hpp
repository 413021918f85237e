#pragma once

#include "speech_engine.hpp"

#include <cstdint>
#include <string>

// Local synthesis: piper --output-raw | aplay.
class PiperEngine : public SpeechEngine {
public:
    PiperEngine(std::string model_en, std::string model_fr, uint32_t sample_rate);

    std::expected<void, Error> speak(const std::string& paragraph) override;

private:
    std::string model_en_;
    std::string model_fr_;
    uint32_t sample_rate_;
};

#pragma once

#include "state_store.hpp"
#include "tts/speech_engine.hpp"

#include <expected>

// Body of the player child process: speaks the stored text paragraph by
// paragraph from a starting index, publishing which one is playing.
class Player {
public:
    Player(const StateStore& store, SpeechEngine& engine, int self_pid);

    std::expected<void, Error> run(int from_paragraph);

private:
    const StateStore& store_;
    SpeechEngine& engine_;
    int self_pid_;
};

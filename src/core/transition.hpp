#pragma once

#include "action.hpp"
#include "session.hpp"

#include <cstdint>
#include <string_view>
#include <vector>

enum class Outcome {
    Ok,
    // Rejected by the state machine; nothing changed.
    AlreadyActive,
    NotRecording,
    NotSpeaking,
    NothingToSpeak,
    // Supervision or collaborator failures.
    SpawnFailed,
    SignalFailed,
    TranscriptionFailed,
    PasteFailed,
    SecretNotFound,
    StoreFailed,
};

std::string_view to_string(Outcome outcome);
bool is_rejection(Outcome outcome);

// Side effects, executed in order by ModeController.
enum class Effect {
    SpawnRecorder,   // fills next.process and next.audio_path
    FinishRecording, // stop recorder, transcribe, paste, drop the audio file
    StoreSpeech,     // persist the Speak text for the player
    StopPlayer,      // stop the player of the current session
    SpawnPlayer,     // start a player at next.paragraph_cursor under next.backend
    PausePlayer,
    ResumePlayer,
    DiscardSpeech,
};

struct Plan {
    Outcome outcome = Outcome::Ok;
    Session next;
    std::vector<Effect> effects;
};

// The state machine proper: no I/O. `current` must already be reconciled.
Plan plan_transition(const Action& action, const Session& current, int64_t now);

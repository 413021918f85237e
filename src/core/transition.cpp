#include "transition.hpp"

#include "tts/paragraphs.hpp"

#include <algorithm>

std::string_view to_string(Outcome outcome) {
    switch (outcome) {
        case Outcome::Ok: return "ok";
        case Outcome::AlreadyActive: return "already active";
        case Outcome::NotRecording: return "not recording";
        case Outcome::NotSpeaking: return "not speaking";
        case Outcome::NothingToSpeak: return "nothing to speak";
        case Outcome::SpawnFailed: return "spawn failed";
        case Outcome::SignalFailed: return "signal failed";
        case Outcome::TranscriptionFailed: return "transcription failed";
        case Outcome::PasteFailed: return "paste failed";
        case Outcome::SecretNotFound: return "secret not found";
        case Outcome::StoreFailed: return "state store failure";
    }
    return "unknown";
}

bool is_rejection(Outcome outcome) {
    return outcome == Outcome::AlreadyActive || outcome == Outcome::NotRecording ||
           outcome == Outcome::NotSpeaking || outcome == Outcome::NothingToSpeak;
}

namespace {

Plan reject(Outcome outcome, const Session& current) {
    return Plan{.outcome = outcome, .next = current, .effects = {}};
}

// Replaces the player at next.paragraph_cursor, keeping a paused session paused.
void restart_player(Plan& plan, const Session& current) {
    plan.effects = {Effect::StopPlayer, Effect::SpawnPlayer};
    if (current.mode == Mode::Paused) plan.effects.push_back(Effect::PausePlayer);
}

} // namespace

Plan plan_transition(const Action& action, const Session& current, int64_t now) {
    Plan plan{.outcome = Outcome::Ok, .next = current, .effects = {}};

    switch (action.kind) {
        case ActionKind::StartRecording:
            if (current.active()) return reject(Outcome::AlreadyActive, current);
            plan.next = Session::idle(current.backend);
            plan.next.mode = Mode::Recording;
            plan.next.created_at = now;
            plan.effects = {Effect::SpawnRecorder};
            return plan;

        case ActionKind::StopRecording:
            if (current.mode != Mode::Recording) return reject(Outcome::NotRecording, current);
            plan.next = Session::idle(current.backend);
            plan.effects = {Effect::FinishRecording};
            return plan;

        case ActionKind::NextParagraph:
            if (!current.speaking()) return reject(Outcome::NotSpeaking, current);
            if (current.paragraph_cursor + 1 >= current.paragraph_count) {
                // Skipping past the last paragraph ends playback.
                plan.next = Session::idle(current.backend);
                plan.effects = {Effect::StopPlayer, Effect::DiscardSpeech};
                return plan;
            }
            plan.next.paragraph_cursor = current.paragraph_cursor + 1;
            restart_player(plan, current);
            return plan;

        case ActionKind::PrevParagraph:
            if (!current.speaking()) return reject(Outcome::NotSpeaking, current);
            plan.next.paragraph_cursor = std::max(0, current.paragraph_cursor - 1);
            restart_player(plan, current);
            return plan;

        case ActionKind::PauseResume:
            if (current.mode == Mode::Speaking) {
                plan.next.mode = Mode::Paused;
                plan.effects = {Effect::PausePlayer};
                return plan;
            }
            if (current.mode == Mode::Paused) {
                plan.next.mode = Mode::Speaking;
                plan.effects = {Effect::ResumePlayer};
                return plan;
            }
            return reject(Outcome::NotSpeaking, current);

        case ActionKind::ToggleBackend:
            plan.next.backend = current.backend == Backend::Local ? Backend::Remote : Backend::Local;
            if (current.speaking()) restart_player(plan, current);
            return plan;

        case ActionKind::Speak: {
            if (current.active()) return reject(Outcome::AlreadyActive, current);
            auto paragraphs = split_paragraphs(action.text);
            if (paragraphs.empty()) return reject(Outcome::NothingToSpeak, current);
            plan.next = Session::idle(current.backend);
            plan.next.mode = Mode::Speaking;
            plan.next.paragraph_count = static_cast<int>(paragraphs.size());
            plan.next.created_at = now;
            plan.effects = {Effect::StoreSpeech, Effect::SpawnPlayer};
            return plan;
        }

        case ActionKind::StopSpeaking:
            if (!current.speaking()) return reject(Outcome::NotSpeaking, current);
            plan.next = Session::idle(current.backend);
            plan.effects = {Effect::StopPlayer, Effect::DiscardSpeech};
            return plan;

        case ActionKind::Status:
            return plan;
    }
    return plan;
}

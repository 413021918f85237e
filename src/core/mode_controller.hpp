#pragma once

#include "action.hpp"
#include "config.hpp"
#include "credentials/credential_store.hpp"
#include "feedback/feedback.hpp"
#include "notify/notifier.hpp"
#include "output/output.hpp"
#include "process_supervisor.hpp"
#include "session.hpp"
#include "state_store.hpp"
#include "storage/history_db.hpp"
#include "transcription/transcriber.hpp"
#include "transition.hpp"

#include <expected>
#include <functional>
#include <string>
#include <vector>

struct TransitionResult {
    Outcome outcome = Outcome::Ok;
    Session session;      // state after the transition
    std::string message;
    std::string text;     // transcription, when there was one
};

// The only writer of the Session. Every request is one critical section
// under the store lock: load, reconcile, plan, run side effects, save.
class ModeController {
public:
    // argv of a player child for a backend and starting paragraph.
    using PlayerCommand = std::function<std::vector<std::string>(Backend, int)>;

    ModeController(Config config, bool verbose, StateStore& store,
                   ProcessSupervisor& supervisor, Transcriber& transcriber,
                   CredentialStore& credentials, OutputMethod& output,
                   Notifier& notifier, Feedback& feedback,
                   PlayerCommand player_command, HistoryDb* history = nullptr);

    ModeController(const ModeController&) = delete;
    ModeController& operator=(const ModeController&) = delete;

    TransitionResult handle(const Action& action);

    // Logout-style cleanup: kill the tracked child, remove the state directory.
    std::expected<void, Error> cleanup();

private:
    struct Reconciled {
        Session session;
        bool dirty = false;
    };

    Reconciled load_reconciled();
    TransitionResult execute(const Plan& plan, const Session& current, const Action& action);
    TransitionResult finish_recording(const Session& current, Session next);
    void stop_child(const ProcessHandle& proc, ProcessKind kind);
    void discard_audio(const std::optional<std::string>& path);
    TransitionResult failure(Outcome outcome, const Session& state, const std::string& message);
    void log(const std::string& msg);

    Config config_;
    bool verbose_;
    Backend default_backend_;

    StateStore& store_;
    ProcessSupervisor& supervisor_;
    Transcriber& transcriber_;
    CredentialStore& credentials_;
    OutputMethod& output_;
    Notifier& notifier_;
    Feedback& feedback_;
    PlayerCommand player_command_;
    HistoryDb* history_;
};

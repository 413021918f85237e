#include <catch2/catch_test_macros.hpp>

#include "mode_controller.hpp"

#include <filesystem>
#include <fstream>
#include <map>
#include <set>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

class FakeSupervisor : public ProcessSupervisor {
public:
    struct Started {
        ProcessKind kind;
        std::vector<std::string> args;
    };

    std::expected<ProcessHandle, Error>
    start(ProcessKind kind, const std::vector<std::string>& args) override {
        if (fail_start) return std::unexpected(Error{ErrorCode::SpawnFailed, "no such program"});
        for (auto& a : args) {
            if (!fail_start_with.empty() && a == fail_start_with) {
                return std::unexpected(Error{ErrorCode::SpawnFailed, "exited immediately"});
            }
        }
        started.push_back({kind, args});
        ProcessHandle h{.pid = next_pid++, .start_time = 1000};
        alive.insert(h.pid);
        return h;
    }

    std::expected<void, Error> signal(const ProcessHandle& proc, ControlSignal sig) override {
        if (!is_alive(proc)) return std::unexpected(Error{ErrorCode::NotRunning, "gone"});
        if (fail_pause && sig == ControlSignal::Pause) {
            return std::unexpected(Error{ErrorCode::Io, "kill failed"});
        }
        signals.emplace_back(proc.pid, sig);
        if (sig == ControlSignal::Kill || (sig == ControlSignal::Stop && !ignore_stop)) {
            alive.erase(proc.pid);
        }
        return {};
    }

    bool is_alive(const ProcessHandle& proc) override { return alive.contains(proc.pid); }

    std::expected<int, Error>
    wait_for_exit(const ProcessHandle& proc, std::chrono::milliseconds) override {
        if (is_alive(proc)) return std::unexpected(Error{ErrorCode::CommandFailed, "still running"});
        return 0;
    }

    size_t count(ProcessKind kind) const {
        size_t n = 0;
        for (auto& s : started) n += s.kind == kind;
        return n;
    }

    bool fail_start = false;
    std::string fail_start_with; // fail any start whose argv holds this word
    bool fail_pause = false;
    bool ignore_stop = false;
    int next_pid = 5000;
    std::set<int> alive;
    std::vector<Started> started;
    std::vector<std::pair<int, ControlSignal>> signals;
};

class FakeTranscriber : public Transcriber {
public:
    std::expected<TranscriptResult, Error>
    transcribe(const std::string& audio_path, const std::string& credential) override {
        calls.push_back(audio_path);
        last_credential = credential;
        return result;
    }

    std::expected<TranscriptResult, Error> result =
        TranscriptResult{.text = "hello world", .duration_s = 1.5, .processing_s = 0.2};
    std::vector<std::string> calls;
    std::string last_credential;
};

class FakeCredentials : public CredentialStore {
public:
    std::expected<std::string, Error> lookup(const std::string& key) override {
        if (auto it = secrets.find(key); it != secrets.end()) return it->second;
        return std::unexpected(Error{ErrorCode::SecretNotFound, key + " not set"});
    }

    std::map<std::string, std::string> secrets = {{"GROQ_API_KEY", "gsk-test"}};
};

class FakeOutput : public OutputMethod {
public:
    std::expected<void, Error> deliver(const std::string& text) override {
        if (fail) return std::unexpected(Error{ErrorCode::NoFocusTarget, "no active window"});
        delivered.push_back(text);
        return {};
    }

    bool fail = false;
    std::vector<std::string> delivered;
};

class FakeNotifier : public Notifier {
public:
    void notify(const std::string& summary, const std::string&) override { summaries.push_back(summary); }
    std::vector<std::string> summaries;
};

class FakeFeedback : public Feedback {
public:
    void cue(Cue c) override { cues.push_back(c); }
    std::vector<Cue> cues;
};

struct Harness {
    std::string dir;
    Config config;
    StateStore store;
    FakeSupervisor supervisor;
    FakeTranscriber transcriber;
    FakeCredentials credentials;
    FakeOutput output;
    FakeNotifier notifier;
    FakeFeedback feedback;
    std::vector<std::pair<Backend, int>> player_launches;
    ModeController controller;

    explicit Harness(Config cfg = {})
        : dir(make_dir()), config(std::move(cfg)), store(dir),
          controller(config, false, store, supervisor, transcriber, credentials, output,
                     notifier, feedback,
                     [this](Backend b, int from) {
                         player_launches.emplace_back(b, from);
                         return std::vector<std::string>{"player", std::string(to_string(b)),
                                                         std::to_string(from)};
                     }) {}

    ~Harness() { std::filesystem::remove_all(dir); }

    TransitionResult run(ActionKind kind, std::string text = {}) {
        return controller.handle(Action{.kind = kind, .text = std::move(text)});
    }

    Session stored() {
        auto s = store.load();
        REQUIRE(s.has_value());
        return *s;
    }

    static std::string make_dir() {
        static int n = 0;
        auto p = std::filesystem::temp_directory_path() /
                 ("dictate_test_controller_" + std::to_string(getpid()) + "_" + std::to_string(n++));
        std::filesystem::remove_all(p);
        return p.string();
    }
};

const std::string kSixParagraphs = "one\n\ntwo\n\nthree\n\nfour\n\nfive\n\nsix";

} // namespace

TEST_CASE("Dictation cycle", "[controller]") {
    Harness h;

    SECTION("HelloWorldIsPasted") {
        auto started = h.run(ActionKind::StartRecording);
        REQUIRE(started.outcome == Outcome::Ok);
        REQUIRE(started.session.mode == Mode::Recording);
        REQUIRE(h.stored().mode == Mode::Recording);

        REQUIRE(h.supervisor.started.size() == 1);
        auto& args = h.supervisor.started[0].args;
        REQUIRE(args.front() == "arecord");
        REQUIRE(args.back() == *started.session.audio_path);

        auto stopped = h.run(ActionKind::StopRecording);
        REQUIRE(stopped.outcome == Outcome::Ok);
        REQUIRE(stopped.text == "hello world");
        REQUIRE(h.output.delivered == std::vector<std::string>{"hello world"});
        REQUIRE(h.transcriber.calls == std::vector<std::string>{*started.session.audio_path});
        REQUIRE(h.transcriber.last_credential == "gsk-test");

        REQUIRE(h.stored().mode == Mode::Idle);
        REQUIRE(h.feedback.cues == std::vector<Cue>{Cue::Start, Cue::Stop, Cue::Ready});
        REQUIRE(h.supervisor.signals.front().second == ControlSignal::Stop);
        REQUIRE(h.notifier.summaries.empty());
    }

    SECTION("StopWhileIdleIsRejected") {
        auto r = h.run(ActionKind::StopRecording);
        REQUIRE(r.outcome == Outcome::NotRecording);
        REQUIRE(h.transcriber.calls.empty());
        REQUIRE(h.supervisor.signals.empty());
        REQUIRE(h.store.load().error().code == ErrorCode::NotFound);
    }

    SECTION("SecondStartIsRejected") {
        REQUIRE(h.run(ActionKind::StartRecording).outcome == Outcome::Ok);
        auto again = h.run(ActionKind::StartRecording);
        REQUIRE(again.outcome == Outcome::AlreadyActive);
        REQUIRE(h.supervisor.count(ProcessKind::Recorder) == 1);
        REQUIRE(h.stored().mode == Mode::Recording);
    }

    SECTION("NetworkErrorReturnsToIdleWithoutPaste") {
        h.transcriber.result = std::unexpected(Error{ErrorCode::NetworkError, "connection refused"});
        REQUIRE(h.run(ActionKind::StartRecording).outcome == Outcome::Ok);

        auto r = h.run(ActionKind::StopRecording);
        REQUIRE(r.outcome == Outcome::TranscriptionFailed);
        REQUIRE(h.output.delivered.empty());
        REQUIRE(h.stored().mode == Mode::Idle);
        REQUIRE(h.notifier.summaries.size() == 1);
    }

    SECTION("EmptyTranscriptSkipsPaste") {
        h.transcriber.result = TranscriptResult{.text = "", .duration_s = 0.5, .processing_s = 0.1};
        REQUIRE(h.run(ActionKind::StartRecording).outcome == Outcome::Ok);

        auto r = h.run(ActionKind::StopRecording);
        REQUIRE(r.outcome == Outcome::Ok);
        REQUIRE(h.output.delivered.empty());
        REQUIRE(h.stored().mode == Mode::Idle);
    }

    SECTION("EmptyAudioIsNotAFailure") {
        h.transcriber.result = std::unexpected(Error{ErrorCode::EmptyAudio, "no samples"});
        REQUIRE(h.run(ActionKind::StartRecording).outcome == Outcome::Ok);

        auto r = h.run(ActionKind::StopRecording);
        REQUIRE(r.outcome == Outcome::Ok);
        REQUIRE(h.output.delivered.empty());
        REQUIRE(h.notifier.summaries.empty());
    }

    SECTION("PasteFailureStillEndsIdle") {
        h.output.fail = true;
        REQUIRE(h.run(ActionKind::StartRecording).outcome == Outcome::Ok);

        auto r = h.run(ActionKind::StopRecording);
        REQUIRE(r.outcome == Outcome::PasteFailed);
        REQUIRE(r.text == "hello world");
        REQUIRE(h.stored().mode == Mode::Idle);
    }

    SECTION("MissingSecretSkipsProvider") {
        h.credentials.secrets.clear();
        REQUIRE(h.run(ActionKind::StartRecording).outcome == Outcome::Ok);

        auto r = h.run(ActionKind::StopRecording);
        REQUIRE(r.outcome == Outcome::SecretNotFound);
        REQUIRE(h.transcriber.calls.empty());
        REQUIRE(h.stored().mode == Mode::Idle);
    }

    SECTION("RecorderIgnoringStopIsKilled") {
        h.supervisor.ignore_stop = true;
        REQUIRE(h.run(ActionKind::StartRecording).outcome == Outcome::Ok);
        REQUIRE(h.run(ActionKind::StopRecording).outcome == Outcome::Ok);

        REQUIRE(h.supervisor.signals.size() == 2);
        REQUIRE(h.supervisor.signals[0].second == ControlSignal::Stop);
        REQUIRE(h.supervisor.signals[1].second == ControlSignal::Kill);
        REQUIRE(h.supervisor.alive.empty());
    }

    SECTION("SpawnFailureLeavesIdle") {
        h.supervisor.fail_start = true;
        auto r = h.run(ActionKind::StartRecording);
        REQUIRE(r.outcome == Outcome::SpawnFailed);
        REQUIRE(r.session.mode == Mode::Idle);
        REQUIRE(h.store.load().error().code == ErrorCode::NotFound);
        REQUIRE(h.notifier.summaries.size() == 1);
        REQUIRE(h.feedback.cues.empty());
    }
}

TEST_CASE("Speech playback", "[controller]") {
    Harness h;

    SECTION("SpeakStartsPlayerAtFirstParagraph") {
        auto r = h.run(ActionKind::Speak, kSixParagraphs);
        REQUIRE(r.outcome == Outcome::Ok);
        REQUIRE(r.session.mode == Mode::Speaking);
        REQUIRE(r.session.paragraph_count == 6);
        REQUIRE(h.player_launches == std::vector<std::pair<Backend, int>>{{Backend::Local, 0}});
        REQUIRE(h.store.load_speech().value() == kSixParagraphs);
    }

    SECTION("ToggleBackendKeepsCursor") {
        REQUIRE(h.run(ActionKind::Speak, kSixParagraphs).outcome == Outcome::Ok);
        for (int i = 0; i < 3; i++) REQUIRE(h.run(ActionKind::NextParagraph).outcome == Outcome::Ok);
        REQUIRE(h.stored().paragraph_cursor == 3);

        auto r = h.run(ActionKind::ToggleBackend);
        REQUIRE(r.outcome == Outcome::Ok);
        REQUIRE(r.session.mode == Mode::Speaking);
        REQUIRE(r.session.backend == Backend::Remote);
        REQUIRE(r.session.paragraph_cursor == 3);
        REQUIRE(h.player_launches.back() == std::pair<Backend, int>{Backend::Remote, 3});
        // Exactly one player alive after all the restarts
        REQUIRE(h.supervisor.alive.size() == 1);
        REQUIRE(h.supervisor.alive.contains(r.session.process->pid));
    }

    SECTION("ProgressIsFoldedIntoCursor") {
        auto r = h.run(ActionKind::Speak, kSixParagraphs);
        REQUIRE(h.store.save_progress(r.session.process->pid, 2).has_value());

        auto status = h.run(ActionKind::Status);
        REQUIRE(status.session.paragraph_cursor == 2);

        auto next = h.run(ActionKind::NextParagraph);
        REQUIRE(next.session.paragraph_cursor == 3);
    }

    SECTION("NextOnLastParagraphStops") {
        REQUIRE(h.run(ActionKind::Speak, "only one").outcome == Outcome::Ok);
        auto r = h.run(ActionKind::NextParagraph);
        REQUIRE(r.outcome == Outcome::Ok);
        REQUIRE(r.session.mode == Mode::Idle);
        REQUIRE(h.supervisor.alive.empty());
        REQUIRE(h.store.load_speech().error().code == ErrorCode::NotFound);
    }

    SECTION("PauseAndResumeSignalThePlayer") {
        auto r = h.run(ActionKind::Speak, kSixParagraphs);
        int pid = r.session.process->pid;

        REQUIRE(h.run(ActionKind::PauseResume).session.mode == Mode::Paused);
        REQUIRE(h.run(ActionKind::PauseResume).session.mode == Mode::Speaking);
        REQUIRE(h.supervisor.signals ==
                std::vector<std::pair<int, ControlSignal>>{{pid, ControlSignal::Pause},
                                                           {pid, ControlSignal::Resume}});
    }

    SECTION("NavigationWhilePausedRepauses") {
        REQUIRE(h.run(ActionKind::Speak, kSixParagraphs).outcome == Outcome::Ok);
        REQUIRE(h.run(ActionKind::PauseResume).outcome == Outcome::Ok);

        auto r = h.run(ActionKind::NextParagraph);
        REQUIRE(r.session.mode == Mode::Paused);
        REQUIRE(h.supervisor.signals.back() ==
                std::pair<int, ControlSignal>{r.session.process->pid, ControlSignal::Pause});
    }

    SECTION("FinishedPlayerResetsToIdle") {
        auto r = h.run(ActionKind::Speak, kSixParagraphs);
        h.supervisor.alive.erase(r.session.process->pid);

        auto status = h.run(ActionKind::Status);
        REQUIRE(status.session.mode == Mode::Idle);
        REQUIRE(h.stored().mode == Mode::Idle);
        REQUIRE(h.run(ActionKind::PauseResume).outcome == Outcome::NotSpeaking);
    }

    SECTION("StopSpeakingDiscardsText") {
        REQUIRE(h.run(ActionKind::Speak, kSixParagraphs).outcome == Outcome::Ok);
        auto r = h.run(ActionKind::StopSpeaking);
        REQUIRE(r.outcome == Outcome::Ok);
        REQUIRE(r.session.mode == Mode::Idle);
        REQUIRE(h.supervisor.alive.empty());
        REQUIRE(h.store.load_speech().error().code == ErrorCode::NotFound);
    }

    SECTION("DictationRejectedWhileSpeaking") {
        REQUIRE(h.run(ActionKind::Speak, kSixParagraphs).outcome == Outcome::Ok);
        REQUIRE(h.run(ActionKind::StartRecording).outcome == Outcome::AlreadyActive);
        REQUIRE(h.supervisor.count(ProcessKind::Recorder) == 0);
    }

    SECTION("FailedBackendSwitchKeepsPlaying") {
        REQUIRE(h.run(ActionKind::Speak, kSixParagraphs).outcome == Outcome::Ok);
        for (int i = 0; i < 3; i++) REQUIRE(h.run(ActionKind::NextParagraph).outcome == Outcome::Ok);
        h.supervisor.fail_start_with = "remote";

        auto r = h.run(ActionKind::ToggleBackend);
        REQUIRE(r.outcome == Outcome::SpawnFailed);
        REQUIRE(r.session.mode == Mode::Speaking);
        REQUIRE(r.session.backend == Backend::Local);
        REQUIRE(r.session.paragraph_cursor == 3);
        REQUIRE(h.player_launches.back() == std::pair<Backend, int>{Backend::Local, 3});

        auto stored = h.stored();
        REQUIRE(stored.backend == Backend::Local);
        REQUIRE(stored.process == r.session.process);
        REQUIRE(h.store.load_speech().value() == kSixParagraphs);
        REQUIRE(h.supervisor.alive == std::set<int>{r.session.process->pid});
        REQUIRE(h.notifier.summaries.size() == 1);
    }

    SECTION("FailedBackendSwitchWhilePausedStaysPaused") {
        REQUIRE(h.run(ActionKind::Speak, kSixParagraphs).outcome == Outcome::Ok);
        REQUIRE(h.run(ActionKind::PauseResume).outcome == Outcome::Ok);
        h.supervisor.fail_start_with = "remote";

        auto r = h.run(ActionKind::ToggleBackend);
        REQUIRE(r.outcome == Outcome::SpawnFailed);
        REQUIRE(h.stored().mode == Mode::Paused);
        REQUIRE(h.stored().backend == Backend::Local);
        REQUIRE(h.supervisor.signals.back() ==
                std::pair<int, ControlSignal>{r.session.process->pid, ControlSignal::Pause});
    }

    SECTION("NoPlayerAtAllSettlesIdle") {
        REQUIRE(h.run(ActionKind::Speak, kSixParagraphs).outcome == Outcome::Ok);
        REQUIRE(h.run(ActionKind::NextParagraph).outcome == Outcome::Ok);
        h.supervisor.fail_start = true;

        auto r = h.run(ActionKind::ToggleBackend);
        REQUIRE(r.outcome == Outcome::SpawnFailed);
        REQUIRE(r.session.mode == Mode::Idle);
        REQUIRE(h.stored().mode == Mode::Idle);
        REQUIRE(h.stored().backend == Backend::Local);
        REQUIRE(h.supervisor.alive.empty());
    }

    SECTION("UnpausablePlayerIsStopped") {
        REQUIRE(h.run(ActionKind::Speak, kSixParagraphs).outcome == Outcome::Ok);
        REQUIRE(h.run(ActionKind::PauseResume).outcome == Outcome::Ok);
        h.supervisor.fail_pause = true;

        auto r = h.run(ActionKind::NextParagraph);
        REQUIRE(r.outcome == Outcome::SignalFailed);
        REQUIRE(h.supervisor.alive.empty());
        REQUIRE(h.stored().mode == Mode::Idle);
        REQUIRE(h.store.load_speech().error().code == ErrorCode::NotFound);
    }

    SECTION("PauseFailureLeavesSessionAlone") {
        auto spoken = h.run(ActionKind::Speak, kSixParagraphs);
        h.supervisor.fail_pause = true;

        auto r = h.run(ActionKind::PauseResume);
        REQUIRE(r.outcome == Outcome::SignalFailed);
        REQUIRE(h.stored().mode == Mode::Speaking);
        REQUIRE(h.stored().process == spoken.session.process);
    }

    SECTION("RejectionPersistsReconciledState") {
        auto r = h.run(ActionKind::Speak, kSixParagraphs);
        h.supervisor.alive.erase(r.session.process->pid);

        REQUIRE(h.run(ActionKind::StopSpeaking).outcome == Outcome::NotSpeaking);
        REQUIRE(h.stored().mode == Mode::Idle);
        REQUIRE(h.store.load_speech().error().code == ErrorCode::NotFound);
    }

    SECTION("BackendSurvivesCycles") {
        REQUIRE(h.run(ActionKind::ToggleBackend).session.backend == Backend::Remote);
        REQUIRE(h.run(ActionKind::StartRecording).outcome == Outcome::Ok);
        REQUIRE(h.run(ActionKind::StopRecording).outcome == Outcome::Ok);
        REQUIRE(h.stored().backend == Backend::Remote);

        REQUIRE(h.run(ActionKind::Speak, "read this").outcome == Outcome::Ok);
        REQUIRE(h.player_launches.back().first == Backend::Remote);
    }
}

TEST_CASE("Reconciliation", "[controller]") {

    SECTION("StaleRecordingWithDeadRecorderIsReaped") {
        Harness h;
        REQUIRE(h.store.ensure_dir().has_value());
        auto audio = h.dir + "/recording-stale.wav";
        std::ofstream(audio) << "RIFF";

        Session s;
        s.mode = Mode::Recording;
        s.process = ProcessHandle{.pid = 4321, .start_time = 7}; // not alive
        s.audio_path = audio;
        s.created_at = unix_now() - 1000;
        REQUIRE(h.store.save(s).has_value());

        auto r = h.run(ActionKind::Status);
        REQUIRE(r.session.mode == Mode::Idle);
        REQUIRE(h.stored().mode == Mode::Idle);
        REQUIRE_FALSE(std::filesystem::exists(audio));

        REQUIRE(h.run(ActionKind::StartRecording).outcome == Outcome::Ok);
    }

    SECTION("FreshRecordingIsKept") {
        Harness h;
        Session s;
        s.mode = Mode::Recording;
        s.process = ProcessHandle{.pid = 4321, .start_time = 7};
        s.audio_path = h.dir + "/recording-fresh.wav";
        s.created_at = unix_now();
        REQUIRE(h.store.save(s).has_value());

        REQUIRE(h.run(ActionKind::Status).session.mode == Mode::Recording);
        REQUIRE(h.run(ActionKind::StartRecording).outcome == Outcome::AlreadyActive);
    }

    SECTION("StaleRecordingWithLiveRecorderIsKept") {
        Harness h;
        h.supervisor.alive.insert(4321);
        Session s;
        s.mode = Mode::Recording;
        s.process = ProcessHandle{.pid = 4321, .start_time = 7};
        s.audio_path = h.dir + "/recording-long.wav";
        s.created_at = unix_now() - 1000;
        REQUIRE(h.store.save(s).has_value());

        REQUIRE(h.run(ActionKind::Status).session.mode == Mode::Recording);
    }

    SECTION("AbandonedTranscriptionIsReaped") {
        Harness h;
        Session s;
        s.mode = Mode::Transcribing;
        s.audio_path = h.dir + "/recording-abandoned.wav";
        s.backend = Backend::Remote;
        s.created_at = unix_now() - 1000;
        REQUIRE(h.store.save(s).has_value());

        auto r = h.run(ActionKind::Status);
        REQUIRE(r.session.mode == Mode::Idle);
        REQUIRE(r.session.backend == Backend::Remote);
    }

    SECTION("CorruptRecordReadsAsIdle") {
        Harness h;
        REQUIRE(h.store.ensure_dir().has_value());
        std::ofstream(h.store.session_path()) << "{ not json";

        auto r = h.run(ActionKind::Status);
        REQUIRE(r.outcome == Outcome::Ok);
        REQUIRE(r.session.mode == Mode::Idle);
        REQUIRE(h.run(ActionKind::StartRecording).outcome == Outcome::Ok);
    }

    SECTION("DefaultBackendFromConfig") {
        Config cfg;
        cfg.tts.default_backend = "remote";
        Harness h(cfg);
        REQUIRE(h.run(ActionKind::Status).session.backend == Backend::Remote);
    }

    SECTION("CleanupKillsChildAndRemovesState") {
        Harness h;
        auto r = h.run(ActionKind::StartRecording);
        REQUIRE(r.outcome == Outcome::Ok);

        REQUIRE(h.controller.cleanup().has_value());
        REQUIRE(h.supervisor.alive.empty());
        REQUIRE_FALSE(std::filesystem::exists(h.dir));
        REQUIRE(h.run(ActionKind::Status).session.mode == Mode::Idle);
    }
}

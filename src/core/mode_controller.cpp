#include "mode_controller.hpp"

#include <chrono>
#include <format>
#include <print>
#include <unistd.h>

ModeController::ModeController(Config config, bool verbose, StateStore& store,
                               ProcessSupervisor& supervisor, Transcriber& transcriber,
                               CredentialStore& credentials, OutputMethod& output,
                               Notifier& notifier, Feedback& feedback,
                               PlayerCommand player_command, HistoryDb* history)
    : config_(std::move(config)), verbose_(verbose),
      default_backend_(backend_from_string(config_.tts.default_backend).value_or(Backend::Local)),
      store_(store), supervisor_(supervisor), transcriber_(transcriber),
      credentials_(credentials), output_(output), notifier_(notifier), feedback_(feedback),
      player_command_(std::move(player_command)), history_(history) {}

TransitionResult ModeController::handle(const Action& action) {
    auto result = store_.with_exclusive_lock([&]() -> TransitionResult {
        auto [current, dirty] = load_reconciled();

        auto plan = plan_transition(action, current, unix_now());
        if (plan.outcome != Outcome::Ok) {
            log(std::format("{} rejected: {} (mode {})", action_name(action.kind),
                            to_string(plan.outcome), to_string(current.mode)));
            if (dirty) {
                if (auto ok = store_.save(current); !ok) {
                    std::println(stderr, "store: {}", ok.error().message);
                }
            }
            return TransitionResult{.outcome = plan.outcome, .session = current,
                                    .message = std::string(to_string(plan.outcome))};
        }

        if (plan.effects.empty() && plan.next == current && !dirty) {
            return TransitionResult{.outcome = Outcome::Ok, .session = current};
        }
        return execute(plan, current, action);
    });

    if (!result) {
        notifier_.notify("dictate: state unavailable", result.error().message);
        return TransitionResult{.outcome = Outcome::StoreFailed, .message = result.error().message};
    }
    return *result;
}

ModeController::Reconciled ModeController::load_reconciled() {
    auto loaded = store_.load();
    if (!loaded) {
        if (loaded.error().code != ErrorCode::NotFound) {
            std::println(stderr, "store: discarding unreadable session: {}", loaded.error().message);
            if (auto ok = store_.clear(); !ok) {
                std::println(stderr, "store: {}", ok.error().message);
            }
        }
        return {Session::idle(default_backend_), false};
    }

    Session s = *loaded;
    auto now = unix_now();
    bool stale = s.age_seconds(now) > static_cast<int64_t>(config_.session.stale_after_seconds);

    switch (s.mode) {
        case Mode::Idle:
            break;

        case Mode::Recording:
            if (stale && !supervisor_.is_alive(*s.process)) {
                std::println(stderr, "store: reaping stale recording session ({}s old, recorder gone)",
                             s.age_seconds(now));
                discard_audio(s.audio_path);
                return {Session::idle(s.backend), true};
            }
            break;

        case Mode::Transcribing:
            if (stale) {
                std::println(stderr, "store: reaping abandoned transcription ({}s old)", s.age_seconds(now));
                discard_audio(s.audio_path);
                return {Session::idle(s.backend), true};
            }
            break;

        case Mode::Speaking:
        case Mode::Paused:
            if (!supervisor_.is_alive(*s.process)) {
                log("Player has exited, session back to idle");
                store_.discard_speech();
                return {Session::idle(s.backend), true};
            }
            if (auto playing = store_.load_progress(s.process->pid);
                playing && *playing > s.paragraph_cursor && *playing < s.paragraph_count) {
                s.paragraph_cursor = *playing;
                return {s, true};
            }
            break;
    }
    return {s, false};
}

TransitionResult ModeController::execute(const Plan& plan, const Session& current, const Action& action) {
    Session next = plan.next;
    std::optional<ProcessHandle> spawned;
    std::optional<std::string> restart_error;

    for (auto effect : plan.effects) {
        switch (effect) {
            case Effect::SpawnRecorder: {
                auto audio_path = store_.new_audio_path();
                auto args = config_.recorder.command;
                args.push_back(audio_path);

                auto proc = supervisor_.start(ProcessKind::Recorder, args);
                if (!proc) {
                    discard_audio(audio_path);
                    return failure(Outcome::SpawnFailed, current, proc.error().message);
                }
                next.process = *proc;
                next.audio_path = audio_path;
                spawned = *proc;
                feedback_.cue(Cue::Start);
                log(std::format("Recording into {} (pid {})", audio_path, proc->pid));
                break;
            }

            case Effect::FinishRecording:
                return finish_recording(current, next);

            case Effect::StoreSpeech:
                if (auto ok = store_.save_speech(action.text); !ok) {
                    return failure(Outcome::StoreFailed, current, ok.error().message);
                }
                break;

            case Effect::StopPlayer:
                if (current.process) stop_child(*current.process, ProcessKind::Player);
                break;

            case Effect::SpawnPlayer: {
                auto proc = supervisor_.start(ProcessKind::Player,
                                              player_command_(next.backend, next.paragraph_cursor));
                if (!proc && !current.speaking()) {
                    store_.discard_speech();
                    return failure(Outcome::SpawnFailed, current, proc.error().message);
                }
                if (!proc) {
                    // The old player is already stopped: bring back the one we had.
                    std::println(stderr, "supervisor: restarting player: {}", proc.error().message);
                    restart_error = proc.error().message;
                    proc = supervisor_.start(ProcessKind::Player,
                                             player_command_(current.backend, current.paragraph_cursor));
                    if (!proc) {
                        store_.discard_speech();
                        Session idle = Session::idle(current.backend);
                        if (auto ok = store_.save(idle); !ok) {
                            std::println(stderr, "store: {}", ok.error().message);
                        }
                        return failure(Outcome::SpawnFailed, idle, *restart_error);
                    }
                    next = current;
                }
                next.process = *proc;
                spawned = *proc;
                log(std::format("Speaking paragraph {}/{} with {} backend (pid {})",
                                next.paragraph_cursor + 1, next.paragraph_count,
                                to_string(next.backend), proc->pid));
                break;
            }

            case Effect::PausePlayer:
            case Effect::ResumePlayer: {
                auto sig = effect == Effect::PausePlayer ? ControlSignal::Pause : ControlSignal::Resume;
                auto ok = supervisor_.signal(*next.process, sig);
                if (!ok && ok.error().code == ErrorCode::NotRunning) {
                    // Playback ended on its own; that is the resting state anyway.
                    log("Player already finished");
                    store_.discard_speech();
                    next = Session::idle(next.backend);
                    spawned.reset();
                } else if (!ok) {
                    if (!spawned) return failure(Outcome::SignalFailed, current, ok.error().message);

                    // A fresh player we cannot pause must not keep playing untracked.
                    stop_child(*spawned, ProcessKind::Player);
                    store_.discard_speech();
                    Session idle = Session::idle(current.backend);
                    if (auto saved = store_.save(idle); !saved) {
                        std::println(stderr, "store: {}", saved.error().message);
                    }
                    return failure(Outcome::SignalFailed, idle, ok.error().message);
                }
                break;
            }

            case Effect::DiscardSpeech:
                store_.discard_speech();
                break;
        }
    }

    if (auto ok = store_.save(next); !ok) {
        if (spawned) stop_child(*spawned, next.mode == Mode::Recording ? ProcessKind::Recorder
                                                                      : ProcessKind::Player);
        if (next.mode == Mode::Recording) discard_audio(next.audio_path);
        return failure(Outcome::StoreFailed, current, ok.error().message);
    }

    if (restart_error) return failure(Outcome::SpawnFailed, next, *restart_error);

    log(std::format("{}: {} -> {}", action_name(action.kind), to_string(current.mode), to_string(next.mode)));
    return TransitionResult{.outcome = Outcome::Ok, .session = next};
}

TransitionResult ModeController::finish_recording(const Session& current, Session next) {
    const auto& recorder = *current.process;
    const auto& audio_path = *current.audio_path;

    stop_child(recorder, ProcessKind::Recorder);
    feedback_.cue(Cue::Stop);

    // Visible while the provider call runs; if we die here the next load
    // reaps it once stale.
    Session transcribing = current;
    transcribing.mode = Mode::Transcribing;
    transcribing.process.reset();
    if (auto ok = store_.save(transcribing); !ok) {
        std::println(stderr, "store: {}", ok.error().message);
    }

    TransitionResult result{.outcome = Outcome::Ok, .session = next};

    auto secret = credentials_.lookup(config_.transcription.credential);
    if (!secret) {
        result.outcome = Outcome::SecretNotFound;
        result.message = secret.error().message;
    } else {
        log("Transcribing...");
        auto transcript = transcriber_.transcribe(audio_path, *secret);

        if (!transcript && transcript.error().code == ErrorCode::EmptyAudio) {
            result.message = "no audio captured";
        } else if (!transcript) {
            result.outcome = Outcome::TranscriptionFailed;
            result.message = std::format("{}: {}", to_string(transcript.error().code),
                                         transcript.error().message);
        } else if (transcript->text.empty()) {
            result.message = "empty transcription";
        } else {
            result.text = transcript->text;
            log(std::format("Transcription complete: {:.1f}s audio, {:.1f}s processing, {} chars",
                            transcript->duration_s, transcript->processing_s, transcript->text.size()));

            auto pasted = output_.deliver(transcript->text);
            if (!pasted) {
                result.outcome = Outcome::PasteFailed;
                result.message = std::format("{}: {}", to_string(pasted.error().code), pasted.error().message);
            } else {
                feedback_.cue(Cue::Ready);
            }

            if (history_ && !history_->insert(transcript->text, transcript->duration_s,
                                              transcript->processing_s, config_.transcription.model,
                                              pasted.has_value())) {
                std::println(stderr, "history: failed to record dictation");
            }
        }
    }

    discard_audio(audio_path);

    // Idle no matter how the collaborators fared.
    if (auto ok = store_.save(next); !ok) {
        std::println(stderr, "store: {}", ok.error().message);
        if (auto cleared = store_.clear(); !cleared) {
            std::println(stderr, "store: {}", cleared.error().message);
        }
    }

    if (result.outcome != Outcome::Ok) {
        notifier_.notify(std::format("dictate: {}", to_string(result.outcome)), result.message);
    }
    return result;
}

void ModeController::stop_child(const ProcessHandle& proc, ProcessKind kind) {
    auto timeout = std::chrono::milliseconds(config_.session.stop_timeout_ms);

    auto stopped = supervisor_.signal(proc, ControlSignal::Stop);
    if (!stopped) {
        if (stopped.error().code != ErrorCode::NotRunning) {
            std::println(stderr, "supervisor: stopping {} {}: {}", to_string(kind), proc.pid,
                         stopped.error().message);
        }
        if (!supervisor_.is_alive(proc)) return;
    }

    auto exited = supervisor_.wait_for_exit(proc, timeout);
    if (exited) {
        log(std::format("{} {} exited ({})", to_string(kind), proc.pid, *exited));
        return;
    }

    std::println(stderr, "supervisor: {} {} ignored stop, killing", to_string(kind), proc.pid);
    if (auto killed = supervisor_.signal(proc, ControlSignal::Kill); !killed) {
        if (killed.error().code != ErrorCode::NotRunning) {
            std::println(stderr, "supervisor: {}", killed.error().message);
        }
        return;
    }
    if (auto gone = supervisor_.wait_for_exit(proc, timeout); !gone) {
        std::println(stderr, "supervisor: {}", gone.error().message);
    }
}

void ModeController::discard_audio(const std::optional<std::string>& path) {
    if (path && !path->empty()) ::unlink(path->c_str());
}

std::expected<void, Error> ModeController::cleanup() {
    auto result = store_.with_exclusive_lock([&]() -> std::expected<void, Error> {
        auto loaded = store_.load();
        if (loaded && loaded->process && supervisor_.is_alive(*loaded->process)) {
            auto kind = loaded->mode == Mode::Recording ? ProcessKind::Recorder : ProcessKind::Player;
            if (auto killed = supervisor_.signal(*loaded->process, ControlSignal::Kill); killed) {
                (void)supervisor_.wait_for_exit(*loaded->process,
                                                std::chrono::milliseconds(config_.session.stop_timeout_ms));
            }
            log(std::format("Killed {} {}", to_string(kind), loaded->process->pid));
        }
        return store_.remove_all();
    });
    if (!result) return std::unexpected(result.error());
    return *result;
}

TransitionResult ModeController::failure(Outcome outcome, const Session& state, const std::string& message) {
    notifier_.notify(std::format("dictate: {}", to_string(outcome)), message);
    return TransitionResult{.outcome = outcome, .session = state, .message = message};
}

void ModeController::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[dictate] {}", msg);
    }
}

#include "action.hpp"
#include "config.hpp"
#include "platform/linux/linux_runtime.hpp"
#include "platform/linux/secret_tool_store.hpp"
#include "tts/openai_speech_engine.hpp"
#include "tts/piper_engine.hpp"
#include "tts/player.hpp"

#include <charconv>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <print>
#include <signal.h>
#include <string>
#include <unistd.h>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitRejected = 3;
constexpr int kExitUsage = 64;

void usage(const char* prog) {
    std::println(stderr, "Usage: {} [options] <command>", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  start-record        Start recording the microphone");
    std::println(stderr, "  stop-record         Stop recording, transcribe and paste");
    std::println(stderr, "  speak               Read text on stdin aloud");
    std::println(stderr, "  stop-speaking       Stop reading aloud");
    std::println(stderr, "  next-paragraph      Skip to the next paragraph");
    std::println(stderr, "  prev-paragraph      Go back one paragraph");
    std::println(stderr, "  pause-resume        Pause or resume reading");
    std::println(stderr, "  toggle-backend      Switch between local and remote speech");
    std::println(stderr, "  status              Show the current mode");
    std::println(stderr, "  cleanup             Kill the tracked child and remove all state");
    std::println(stderr, "  history [--limit N] Show recent dictations");
    std::println(stderr, "Options:");
    std::println(stderr, "  -v, --verbose       Enable verbose logging");
    std::println(stderr, "  -c, --config PATH   Config file path");
}

bool parse_int(const std::string& s, int& out) {
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size();
}

int exit_code(Outcome outcome) {
    if (outcome == Outcome::Ok) return kExitOk;
    if (is_rejection(outcome)) return kExitRejected;
    return kExitFailure;
}

void print_status(const Session& s) {
    std::println("Mode: {}", to_string(s.mode));
    std::println("Backend: {}", to_string(s.backend));
    if (s.speaking()) {
        std::println("Paragraph: {}/{}", s.paragraph_cursor + 1, s.paragraph_count);
    }
    if (s.process) {
        std::println("Process: {}", s.process->pid);
    }
    if (s.active()) {
        std::println("Age: {}s", s.age_seconds(unix_now()));
    }
}

// Player child: `dictate play --backend B --from N --state-dir DIR`.
int run_player(const Config& config, const std::string& backend_name, int from,
               const std::string& state_dir) {
    auto backend = backend_from_string(backend_name);
    if (!backend || state_dir.empty()) {
        std::println(stderr, "play: need --backend local|remote and --state-dir");
        return kExitUsage;
    }

    StateStore store(state_dir);
    SecretToolStore credentials;

    std::unique_ptr<SpeechEngine> engine;
    if (*backend == Backend::Remote) {
        engine = std::make_unique<OpenAiSpeechEngine>(config.tts.remote_url, config.tts.remote_model,
                                                      config.tts.remote_voice, config.tts.credential,
                                                      credentials);
    } else {
        engine = std::make_unique<PiperEngine>(config.tts.piper_model_en, config.tts.piper_model_fr,
                                               config.tts.piper_sample_rate);
    }

    Player player(store, *engine, static_cast<int>(::getpid()));
    if (auto ok = player.run(from); !ok) {
        std::println(stderr, "player: {}: {}", to_string(ok.error().code), ok.error().message);
        return kExitFailure;
    }
    return kExitOk;
}

int show_history(LinuxRuntime& runtime, int limit) {
    if (!runtime.history().is_open()) {
        std::println(stderr, "history: not available");
        return kExitFailure;
    }
    for (auto& entry : runtime.history().recent(limit)) {
        std::println("[{}] {}", entry.timestamp, entry.text);
        std::println("  {:.1f}s audio, {:.1f}s processing, {}{}", entry.audio_duration,
                     entry.processing_time, entry.model, entry.pasted ? "" : ", not pasted");
    }
    return kExitOk;
}

} // namespace

int main(int argc, char* argv[]) {
    bool verbose = false;
    std::string config_path;
    std::string command;
    int limit = 10;

    // play-only options
    std::string backend_name;
    std::string state_dir;
    int from = 0;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--limit" && i + 1 < argc) {
            if (!parse_int(argv[++i], limit) || limit <= 0) {
                std::println(stderr, "Invalid --limit: {}", argv[i]);
                return kExitUsage;
            }
        } else if (arg == "--backend" && i + 1 < argc) {
            backend_name = argv[++i];
        } else if (arg == "--from" && i + 1 < argc) {
            if (!parse_int(argv[++i], from)) {
                std::println(stderr, "Invalid --from: {}", argv[i]);
                return kExitUsage;
            }
        } else if (arg == "--state-dir" && i + 1 < argc) {
            state_dir = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return kExitOk;
        } else if (command.empty() && !arg.starts_with("-")) {
            command = arg;
        } else {
            std::println(stderr, "Unknown argument: {}", arg);
            usage(argv[0]);
            return kExitUsage;
        }
    }

    if (command.empty()) {
        usage(argv[0]);
        return kExitUsage;
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);

    // Pipe readers (aplay, paste helpers) may exit before we finish writing.
    ::signal(SIGPIPE, SIG_IGN);

    if (command == "play") {
        return run_player(config, backend_name, from, state_dir);
    }

    std::optional<ActionKind> kind;
    if (command != "cleanup" && command != "history") {
        kind = action_from_name(command);
        if (!kind) {
            std::println(stderr, "Unknown command: {}", command);
            usage(argv[0]);
            return kExitUsage;
        }
    }

    LinuxRuntime runtime(std::move(config), verbose, config_path);
    if (!runtime.init()) return kExitFailure;

    if (command == "history") return show_history(runtime, limit);

    if (command == "cleanup") {
        if (auto ok = runtime.controller().cleanup(); !ok) {
            std::println(stderr, "cleanup: {}", ok.error().message);
            return kExitFailure;
        }
        return kExitOk;
    }

    Action action{.kind = *kind, .text = {}};
    if (*kind == ActionKind::Speak) {
        action.text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }

    auto result = runtime.controller().handle(action);

    if (*kind == ActionKind::Status) {
        print_status(result.session);
    } else if (result.outcome == Outcome::Ok) {
        if (!result.text.empty()) std::println("{}", result.text);
        else if (verbose) std::println("OK ({})", to_string(result.session.mode));
    } else if (is_rejection(result.outcome)) {
        std::println(stderr, "{}: {}", command, to_string(result.outcome));
    } else {
        std::println(stderr, "Error: {}{}{}", to_string(result.outcome),
                     result.message.empty() ? "" : ": ", result.message);
    }

    return exit_code(result.outcome);
}

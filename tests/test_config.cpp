#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "dictate_test_config_XXXXXX";
        // mkstemp needs a mutable char*
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        REQUIRE(::write(fd, content.data(), content.size()) == static_cast<ssize_t>(content.size()));
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.recorder.command.front() == "arecord");
        REQUIRE(cfg.transcription.model == "whisper-large-v3-turbo");
        REQUIRE(cfg.transcription.language.empty());
        REQUIRE(cfg.transcription.credential == "GROQ_API_KEY");
        REQUIRE(cfg.tts.default_backend == "local");
        REQUIRE(cfg.tts.remote_voice == "shimmer");
        REQUIRE(cfg.output.display == "x11");
        REQUIRE_FALSE(cfg.output.terminal_shortcut);
        REQUIRE(cfg.session.stale_after_seconds == 300);
        REQUIRE(cfg.session.spawn_grace_ms == 150);
        REQUIRE(cfg.session.stop_timeout_ms == 5000);
        REQUIRE(cfg.hotkeys.size() == 6);
        REQUIRE(cfg.hotkeys.at("start-record") == "super+f5");
        REQUIRE(cfg.hotkeys.at("prev-paragraph") == "super+shift+f7");
        REQUIRE(cfg.state_dir.empty());
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "recorder": { "command": ["parecord", "--file-format=wav"] },
            "transcription": {
                "url": "http://10.0.0.1:9090/v1/audio/transcriptions",
                "model": "whisper-1",
                "language": "fr",
                "credential": "OPENAI_API_KEY",
                "timeout_s": 30
            },
            "tts": { "default_backend": "remote", "remote_voice": "nova", "piper_sample_rate": 16000 },
            "output": { "display": "wayland", "terminal_shortcut": true, "terminals": ["foot"] },
            "session": { "stale_after_seconds": 60, "spawn_grace_ms": 50, "stop_timeout_ms": 1000 },
            "feedback": { "enabled": false },
            "notify": { "enabled": false },
            "history": { "enabled": false },
            "hotkeys": { "start-record": "ctrl+alt+r" },
            "state_dir": "/tmp/dictate-test-state"
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.recorder.command == std::vector<std::string>{"parecord", "--file-format=wav"});
        REQUIRE(cfg.transcription.url == "http://10.0.0.1:9090/v1/audio/transcriptions");
        REQUIRE(cfg.transcription.model == "whisper-1");
        REQUIRE(cfg.transcription.language == "fr");
        REQUIRE(cfg.transcription.credential == "OPENAI_API_KEY");
        REQUIRE(cfg.transcription.timeout_s == 30);
        REQUIRE(cfg.tts.default_backend == "remote");
        REQUIRE(cfg.tts.remote_voice == "nova");
        REQUIRE(cfg.tts.piper_sample_rate == 16000);
        REQUIRE(cfg.output.display == "wayland");
        REQUIRE(cfg.output.terminal_shortcut);
        REQUIRE(cfg.output.terminals == std::vector<std::string>{"foot"});
        REQUIRE(cfg.session.stale_after_seconds == 60);
        REQUIRE(cfg.session.spawn_grace_ms == 50);
        REQUIRE(cfg.session.stop_timeout_ms == 1000);
        REQUIRE_FALSE(cfg.feedback.enabled);
        REQUIRE_FALSE(cfg.notify.enabled);
        REQUIRE_FALSE(cfg.history.enabled);
        REQUIRE(cfg.hotkeys.at("start-record") == "ctrl+alt+r");
        // Unlisted hotkeys keep their defaults
        REQUIRE(cfg.hotkeys.at("stop-record") == "super+f6");
        REQUIRE(cfg.state_dir == "/tmp/dictate-test-state");
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "transcription": { "language": "fr" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.transcription.language == "fr");
        // Other fields retain defaults
        REQUIRE(cfg.transcription.model == "whisper-large-v3-turbo");
        REQUIRE(cfg.tts.default_backend == "local");
        REQUIRE(cfg.session.stale_after_seconds == 300);
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        // Falls back to defaults
        REQUIRE(cfg.transcription.model == "whisper-large-v3-turbo");
        REQUIRE(cfg.session.stale_after_seconds == 300);
    }

    SECTION("WrongTypeFallsBackToDefaults") {
        TmpFile f(R"({ "session": { "stale_after_seconds": "soon" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.session.stale_after_seconds == 300);
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/dictate_test_nonexistent_config_file.json");
        REQUIRE(cfg.transcription.model == "whisper-large-v3-turbo");
        REQUIRE(cfg.session.stale_after_seconds == 300);
    }
}

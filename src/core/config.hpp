#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

struct Config {
    struct Recorder {
        // The audio path is appended as the last argument.
        std::vector<std::string> command = {
            "arecord", "-f", "S16_LE", "-r", "16000", "-c", "1", "-t", "wav", "-q"};
    } recorder;

    struct Transcription {
        std::string url = "https://api.groq.com/openai/v1/audio/transcriptions";
        std::string model = "whisper-large-v3-turbo";
        std::string language; // empty = provider auto-detects
        std::string credential = "GROQ_API_KEY";
        long timeout_s = 120;
    } transcription;

    struct Tts {
        std::string default_backend = "local"; // "local" (piper) or "remote" (openai)
        std::string piper_model_en = "/tmp/piper-voices/en_medium.onnx";
        std::string piper_model_fr = "/tmp/piper-voices/fr_medium.onnx";
        uint32_t piper_sample_rate = 22050;
        std::string remote_url = "https://api.openai.com/v1/audio/speech";
        std::string remote_model = "tts-1";
        std::string remote_voice = "shimmer";
        std::string credential = "OPENAI_API_KEY";
    } tts;

    struct Output {
        std::string display = "x11"; // "x11" or "wayland"
        // Wayland cannot query the focused window class; paste with
        // ctrl+shift+v everywhere when set.
        bool terminal_shortcut = false;
        std::vector<std::string> terminals = {
            "gnome-terminal", "xterm", "urxvt", "alacritty", "kitty", "konsole",
            "xfce4-terminal", "terminator", "tilix", "st", "sakura", "guake",
            "terminology", "wezterm", "foot"};
    } output;

    struct SessionPolicy {
        uint32_t stale_after_seconds = 300;
        uint32_t spawn_grace_ms = 150;
        uint32_t stop_timeout_ms = 5000;
    } session;

    struct Feedback {
        bool enabled = true;
    } feedback;

    struct Notify {
        bool enabled = true;
    } notify;

    struct History {
        bool enabled = true;
    } history;

    // action name -> combo, e.g. "start-record" -> "super+f5"
    std::map<std::string, std::string> hotkeys = {
        {"start-record", "super+f5"},
        {"stop-record", "super+f6"},
        {"next-paragraph", "super+f7"},
        {"prev-paragraph", "super+shift+f7"},
        {"pause-resume", "super+f8"},
        {"toggle-backend", "super+f9"},
    };

    // Empty means platform::runtime_dir().
    std::string state_dir;

    static Config load(const std::string& path);
    static Config load_default();
};

#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("recorder")) {
            auto& r = j["recorder"];
            if (r.contains("command")) cfg.recorder.command = r["command"].get<std::vector<std::string>>();
        }

        if (j.contains("transcription")) {
            auto& t = j["transcription"];
            if (t.contains("url")) cfg.transcription.url = t["url"].get<std::string>();
            if (t.contains("model")) cfg.transcription.model = t["model"].get<std::string>();
            if (t.contains("language")) cfg.transcription.language = t["language"].get<std::string>();
            if (t.contains("credential")) cfg.transcription.credential = t["credential"].get<std::string>();
            if (t.contains("timeout_s")) cfg.transcription.timeout_s = t["timeout_s"].get<long>();
        }

        if (j.contains("tts")) {
            auto& t = j["tts"];
            if (t.contains("default_backend")) cfg.tts.default_backend = t["default_backend"].get<std::string>();
            if (t.contains("piper_model_en")) cfg.tts.piper_model_en = t["piper_model_en"].get<std::string>();
            if (t.contains("piper_model_fr")) cfg.tts.piper_model_fr = t["piper_model_fr"].get<std::string>();
            if (t.contains("piper_sample_rate")) cfg.tts.piper_sample_rate = t["piper_sample_rate"].get<uint32_t>();
            if (t.contains("remote_url")) cfg.tts.remote_url = t["remote_url"].get<std::string>();
            if (t.contains("remote_model")) cfg.tts.remote_model = t["remote_model"].get<std::string>();
            if (t.contains("remote_voice")) cfg.tts.remote_voice = t["remote_voice"].get<std::string>();
            if (t.contains("credential")) cfg.tts.credential = t["credential"].get<std::string>();
        }

        if (j.contains("output")) {
            auto& o = j["output"];
            if (o.contains("display")) cfg.output.display = o["display"].get<std::string>();
            if (o.contains("terminal_shortcut")) cfg.output.terminal_shortcut = o["terminal_shortcut"].get<bool>();
            if (o.contains("terminals")) cfg.output.terminals = o["terminals"].get<std::vector<std::string>>();
        }

        if (j.contains("session")) {
            auto& s = j["session"];
            if (s.contains("stale_after_seconds")) cfg.session.stale_after_seconds = s["stale_after_seconds"].get<uint32_t>();
            if (s.contains("spawn_grace_ms")) cfg.session.spawn_grace_ms = s["spawn_grace_ms"].get<uint32_t>();
            if (s.contains("stop_timeout_ms")) cfg.session.stop_timeout_ms = s["stop_timeout_ms"].get<uint32_t>();
        }

        if (j.contains("feedback")) cfg.feedback.enabled = j["feedback"].value("enabled", cfg.feedback.enabled);
        if (j.contains("notify")) cfg.notify.enabled = j["notify"].value("enabled", cfg.notify.enabled);
        if (j.contains("history")) cfg.history.enabled = j["history"].value("enabled", cfg.history.enabled);

        if (j.contains("hotkeys")) {
            for (auto& [action, combo] : j["hotkeys"].items()) {
                cfg.hotkeys[action] = combo.get<std::string>();
            }
        }

        if (j.contains("state_dir")) cfg.state_dir = j["state_dir"].get<std::string>();

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}

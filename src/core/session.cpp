#include "session.hpp"

#include <chrono>
#include <format>

using json = nlohmann::json;

Session Session::idle(Backend backend) {
    Session s;
    s.backend = backend;
    return s;
}

std::string_view to_string(Mode mode) {
    switch (mode) {
        case Mode::Idle: return "idle";
        case Mode::Recording: return "recording";
        case Mode::Transcribing: return "transcribing";
        case Mode::Speaking: return "speaking";
        case Mode::Paused: return "paused";
    }
    return "unknown";
}

std::string_view to_string(Backend backend) {
    return backend == Backend::Remote ? "remote" : "local";
}

std::optional<Mode> mode_from_string(std::string_view s) {
    if (s == "idle") return Mode::Idle;
    if (s == "recording") return Mode::Recording;
    if (s == "transcribing") return Mode::Transcribing;
    if (s == "speaking") return Mode::Speaking;
    if (s == "paused") return Mode::Paused;
    return std::nullopt;
}

std::optional<Backend> backend_from_string(std::string_view s) {
    if (s == "local") return Backend::Local;
    if (s == "remote") return Backend::Remote;
    return std::nullopt;
}

std::expected<void, Error> validate(const Session& s) {
    auto corrupt = [](std::string msg) {
        return std::unexpected(Error{ErrorCode::Corrupt, std::move(msg)});
    };

    if (s.process && s.process->pid <= 0) {
        return corrupt(std::format("invalid pid {}", s.process->pid));
    }
    if (s.paragraph_cursor < 0 || s.paragraph_count < 0) {
        return corrupt("negative paragraph index");
    }

    switch (s.mode) {
        case Mode::Idle:
            if (s.process) return corrupt("idle session owns a process");
            break;
        case Mode::Recording:
            if (!s.process) return corrupt("recording without recorder pid");
            if (!s.audio_path || s.audio_path->empty()) return corrupt("recording without audio path");
            break;
        case Mode::Transcribing:
            if (!s.audio_path || s.audio_path->empty()) return corrupt("transcribing without audio path");
            break;
        case Mode::Speaking:
        case Mode::Paused:
            if (!s.process) return corrupt("speaking without player pid");
            if (s.paragraph_cursor >= s.paragraph_count) {
                return corrupt(std::format("paragraph cursor {} outside [0, {})",
                                           s.paragraph_cursor, s.paragraph_count));
            }
            break;
    }
    return {};
}

json session_to_json(const Session& s) {
    json j = {
        {"mode", to_string(s.mode)},
        {"backend", to_string(s.backend)},
        {"paragraph_cursor", s.paragraph_cursor},
        {"paragraph_count", s.paragraph_count},
        {"created_at", s.created_at},
    };
    if (s.process) {
        j["pid"] = s.process->pid;
        j["start_time"] = s.process->start_time;
    }
    if (s.audio_path) {
        j["audio_path"] = *s.audio_path;
    }
    return j;
}

std::expected<Session, Error> session_from_json(const json& j) {
    Session s;
    try {
        auto mode = mode_from_string(j.at("mode").get<std::string>());
        if (!mode) return std::unexpected(Error{ErrorCode::Corrupt, "unknown mode"});
        s.mode = *mode;

        auto backend = backend_from_string(j.value("backend", std::string("local")));
        if (!backend) return std::unexpected(Error{ErrorCode::Corrupt, "unknown backend"});
        s.backend = *backend;

        if (j.contains("pid")) {
            s.process = ProcessHandle{
                .pid = j["pid"].get<int>(),
                .start_time = j.value("start_time", uint64_t{0}),
            };
        }
        if (j.contains("audio_path")) s.audio_path = j["audio_path"].get<std::string>();

        s.paragraph_cursor = j.value("paragraph_cursor", 0);
        s.paragraph_count = j.value("paragraph_count", 0);
        s.created_at = j.value("created_at", int64_t{0});
    } catch (const json::exception& e) {
        return std::unexpected(Error{ErrorCode::Corrupt, e.what()});
    }

    if (auto ok = validate(s); !ok) return std::unexpected(ok.error());
    return s;
}

int64_t unix_now() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

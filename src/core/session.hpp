#pragma once

#include "error.hpp"

#include <cstdint>
#include <expected>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

enum class Mode { Idle, Recording, Transcribing, Speaking, Paused };

enum class Backend { Local, Remote };

// A child process identified by pid plus its start time (clock ticks since
// boot, field 22 of /proc/<pid>/stat). A recycled pid never matches.
struct ProcessHandle {
    int pid = 0;
    uint64_t start_time = 0;

    bool operator==(const ProcessHandle&) const = default;
};

// Durable record of the current mode and the resources it owns.
struct Session {
    Mode mode = Mode::Idle;
    std::optional<ProcessHandle> process;   // recorder or player
    std::optional<std::string> audio_path;
    Backend backend = Backend::Local;
    int paragraph_cursor = 0;
    int paragraph_count = 0;
    int64_t created_at = 0;                 // unix seconds

    bool operator==(const Session&) const = default;

    static Session idle(Backend backend);

    bool active() const { return mode != Mode::Idle; }
    bool speaking() const { return mode == Mode::Speaking || mode == Mode::Paused; }
    int64_t age_seconds(int64_t now) const { return now - created_at; }
};

std::string_view to_string(Mode mode);
std::string_view to_string(Backend backend);
std::optional<Mode> mode_from_string(std::string_view s);
std::optional<Backend> backend_from_string(std::string_view s);

// Checks the record invariants. A stored record that fails them is corrupt.
std::expected<void, Error> validate(const Session& s);

nlohmann::json session_to_json(const Session& s);
std::expected<Session, Error> session_from_json(const nlohmann::json& j);

int64_t unix_now();

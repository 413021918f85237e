#pragma once

#include "error.hpp"
#include "session.hpp"

#include <chrono>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

enum class ProcessKind { Recorder, Player };

enum class ControlSignal { Stop, Pause, Resume, Kill };

constexpr std::string_view to_string(ProcessKind kind) {
    return kind == ProcessKind::Recorder ? "recorder" : "player";
}

// Starts and controls the single tracked child. Handles are only ever ones
// this supervisor (in this or another invocation) started; identity is
// checked on every use, never just the numeric pid.
class ProcessSupervisor {
public:
    static constexpr int kExitUnknown = -1;

    virtual ~ProcessSupervisor() = default;

    // SpawnFailed if the executable is missing or the child exits at once.
    virtual std::expected<ProcessHandle, Error>
        start(ProcessKind kind, const std::vector<std::string>& args) = 0;

    // NotRunning if the handle no longer names a live process.
    virtual std::expected<void, Error> signal(const ProcessHandle& proc, ControlSignal sig) = 0;

    virtual bool is_alive(const ProcessHandle& proc) = 0;

    // Exit code, or kExitUnknown when the process was not our direct child.
    virtual std::expected<int, Error>
        wait_for_exit(const ProcessHandle& proc, std::chrono::milliseconds timeout) = 0;
};

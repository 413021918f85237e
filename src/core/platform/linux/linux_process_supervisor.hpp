#pragma once

#include "process_supervisor.hpp"

#include <chrono>
#include <map>
#include <set>

class LinuxProcessSupervisor : public ProcessSupervisor {
public:
    explicit LinuxProcessSupervisor(std::chrono::milliseconds spawn_grace = std::chrono::milliseconds(150));

    std::expected<ProcessHandle, Error>
        start(ProcessKind kind, const std::vector<std::string>& args) override;
    std::expected<void, Error> signal(const ProcessHandle& proc, ControlSignal sig) override;
    bool is_alive(const ProcessHandle& proc) override;
    std::expected<int, Error>
        wait_for_exit(const ProcessHandle& proc, std::chrono::milliseconds timeout) override;

    // Collects exited direct children without blocking (SIGCHLD handler path).
    // Only children started here keep an exit code; other helpers are just reaped.
    void reap_children();

    size_t recorded_exits() const { return exited_.size(); }

private:
    // Returns true and records the status if pid was a child that has exited.
    bool try_reap(int pid);
    void record_exit(int pid, int status);

    std::chrono::milliseconds spawn_grace_;
    std::set<int> children_;    // started here, exit not yet recorded
    std::map<int, int> exited_; // pid -> exit code, bounded
};

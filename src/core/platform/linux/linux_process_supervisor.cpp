#include "platform/linux/linux_process_supervisor.hpp"

#include "platform/linux/procfs.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <print>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace {

constexpr size_t kMaxRecordedExits = 16;

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return ProcessSupervisor::kExitUnknown;
}

int to_signo(ControlSignal sig) {
    switch (sig) {
        case ControlSignal::Stop: return SIGINT;
        case ControlSignal::Pause: return SIGSTOP;
        case ControlSignal::Resume: return SIGCONT;
        case ControlSignal::Kill: return SIGKILL;
    }
    return SIGTERM;
}

void redirect_to_devnull(int target_fd, int flags) {
    int fd = ::open("/dev/null", flags);
    if (fd >= 0) {
        ::dup2(fd, target_fd);
        ::close(fd);
    }
}

} // namespace

LinuxProcessSupervisor::LinuxProcessSupervisor(std::chrono::milliseconds spawn_grace)
    : spawn_grace_(spawn_grace) {}

std::expected<ProcessHandle, Error>
LinuxProcessSupervisor::start(ProcessKind kind, const std::vector<std::string>& args) {
    if (args.empty()) {
        return std::unexpected(Error{ErrorCode::SpawnFailed, "empty command"});
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    // Close-on-exec pipe: EOF means exec succeeded, otherwise the child
    // writes its errno before exiting.
    int pipefd[2];
    if (::pipe2(pipefd, O_CLOEXEC) < 0) {
        return std::unexpected(Error{ErrorCode::SpawnFailed,
                                     std::string("pipe2() failed: ") + std::strerror(errno)});
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(pipefd[0]);
        ::close(pipefd[1]);
        return std::unexpected(Error{ErrorCode::SpawnFailed,
                                     std::string("fork() failed: ") + std::strerror(errno)});
    }

    if (pid == 0) {
        // Own process group so pause/resume/stop reach the whole pipeline.
        ::setpgid(0, 0);

        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);
        ::signal(SIGINT, SIG_DFL);
        ::signal(SIGTERM, SIG_DFL);
        ::signal(SIGCHLD, SIG_DFL);
        ::signal(SIGPIPE, SIG_DFL);

        redirect_to_devnull(STDIN_FILENO, O_RDONLY);
        redirect_to_devnull(STDOUT_FILENO, O_WRONLY);
        if (kind == ProcessKind::Recorder) redirect_to_devnull(STDERR_FILENO, O_WRONLY);

        ::execvp(argv[0], argv.data());
        int err = errno;
        ssize_t ignored = ::write(pipefd[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    ::setpgid(pid, pid);
    ::close(pipefd[1]);
    exited_.erase(pid);
    children_.insert(pid);

    int child_errno = 0;
    ssize_t n;
    while ((n = ::read(pipefd[0], &child_errno, sizeof(child_errno))) < 0 && errno == EINTR) {}
    ::close(pipefd[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        ::waitpid(pid, nullptr, 0);
        children_.erase(pid);
        return std::unexpected(Error{ErrorCode::SpawnFailed,
                                     std::format("{}: {}", args[0], std::strerror(child_errno))});
    }

    // A child that dies within the grace period never really started.
    auto deadline = std::chrono::steady_clock::now() + spawn_grace_;
    while (std::chrono::steady_clock::now() < deadline) {
        if (try_reap(pid)) {
            int code = exited_[pid];
            exited_.erase(pid);
            return std::unexpected(Error{ErrorCode::SpawnFailed,
                                         std::format("{} exited immediately (code {})", args[0], code)});
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    auto st = procfs::read_stat(pid);
    if (!st) {
        try_reap(pid);
        children_.erase(pid);
        exited_.erase(pid);
        return std::unexpected(Error{ErrorCode::SpawnFailed,
                                     std::format("{} vanished after start", args[0])});
    }

    return ProcessHandle{.pid = pid, .start_time = st->start_time};
}

std::expected<void, Error> LinuxProcessSupervisor::signal(const ProcessHandle& proc, ControlSignal sig) {
    if (!is_alive(proc)) {
        return std::unexpected(Error{ErrorCode::NotRunning,
                                     std::format("process {} is not running", proc.pid)});
    }

    int signo = to_signo(sig);
    if (::kill(-proc.pid, signo) < 0) {
        // Not a group leader (setpgid lost a race): fall back to the process.
        if (errno != ESRCH || ::kill(proc.pid, signo) < 0) {
            if (errno == ESRCH) {
                return std::unexpected(Error{ErrorCode::NotRunning,
                                             std::format("process {} is not running", proc.pid)});
            }
            return std::unexpected(Error{ErrorCode::Io,
                                         std::format("kill({}) failed: {}", proc.pid, std::strerror(errno))});
        }
    }

    // A stopped group only acts on the stop request once continued.
    if (sig == ControlSignal::Stop) {
        if (::kill(-proc.pid, SIGCONT) < 0) ::kill(proc.pid, SIGCONT);
    }
    return {};
}

bool LinuxProcessSupervisor::is_alive(const ProcessHandle& proc) {
    if (proc.pid <= 0) return false;
    if (try_reap(proc.pid)) return false;

    auto st = procfs::read_stat(proc.pid);
    if (!st) return false;
    if (st->state == 'Z' || st->state == 'X' || st->state == 'x') return false;
    return st->start_time == proc.start_time;
}

std::expected<int, Error>
LinuxProcessSupervisor::wait_for_exit(const ProcessHandle& proc, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        bool alive = is_alive(proc);
        if (auto it = exited_.find(proc.pid); it != exited_.end()) {
            int code = it->second;
            exited_.erase(it);
            return code;
        }

        // Not our child (started by another invocation): only /proc tells.
        if (!alive) return kExitUnknown;

        if (std::chrono::steady_clock::now() >= deadline) {
            return std::unexpected(Error{ErrorCode::CommandFailed,
                                         std::format("process {} did not exit within {}ms",
                                                     proc.pid, timeout.count())});
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

void LinuxProcessSupervisor::reap_children() {
    int status;
    pid_t pid;
    while ((pid = ::waitpid(-1, &status, WNOHANG)) > 0) {
        record_exit(pid, status);
    }
}

bool LinuxProcessSupervisor::try_reap(int pid) {
    int status;
    pid_t r = ::waitpid(pid, &status, WNOHANG);
    if (r == pid) {
        record_exit(pid, status);
        return true;
    }
    return false;
}

void LinuxProcessSupervisor::record_exit(int pid, int status) {
    if (children_.erase(pid) == 0) return;
    // Exits nobody asked about (a player that finished on its own) would
    // otherwise pile up for the lifetime of the listener.
    if (exited_.size() >= kMaxRecordedExits) exited_.erase(exited_.begin());
    exited_[pid] = decode_status(status);
}

#include "platform/linux/subprocess.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace subprocess {

namespace {

std::vector<char*> make_argv(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);
    return argv;
}

// The listener blocks signals it reads through signalfd; children start clean.
void reset_signal_mask() {
    sigset_t none;
    sigemptyset(&none);
    ::sigprocmask(SIG_SETMASK, &none, nullptr);
}

Error sys_error(const char* what) {
    return Error{ErrorCode::CommandFailed, std::string(what) + " failed: " + std::strerror(errno)};
}

} // namespace

std::expected<Result, Error> run(const std::vector<std::string>& args,
                                 std::string_view input, bool capture_output) {
    if (args.empty()) return std::unexpected(Error{ErrorCode::CommandFailed, "empty command"});
    auto argv = make_argv(args);

    int in_pipe[2];
    int out_pipe[2] = {-1, -1};
    if (::pipe2(in_pipe, O_CLOEXEC) < 0) return std::unexpected(sys_error("pipe()"));
    if (capture_output && ::pipe2(out_pipe, O_CLOEXEC) < 0) {
        ::close(in_pipe[0]);
        ::close(in_pipe[1]);
        return std::unexpected(sys_error("pipe()"));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        auto err = sys_error("fork()");
        ::close(in_pipe[0]);
        ::close(in_pipe[1]);
        if (capture_output) {
            ::close(out_pipe[0]);
            ::close(out_pipe[1]);
        }
        return std::unexpected(err);
    }

    if (pid == 0) {
        reset_signal_mask();
        ::dup2(in_pipe[0], STDIN_FILENO);
        if (capture_output) {
            ::dup2(out_pipe[1], STDOUT_FILENO);
        } else {
            int devnull = ::open("/dev/null", O_WRONLY);
            if (devnull >= 0) ::dup2(devnull, STDOUT_FILENO);
        }
        ::execvp(argv[0], argv.data());
        ::_exit(127);
    }

    ::close(in_pipe[0]);
    if (capture_output) ::close(out_pipe[1]);

    size_t total_written = 0;
    while (total_written < input.size()) {
        ssize_t n = ::write(in_pipe[1], input.data() + total_written, input.size() - total_written);
        if (n < 0) {
            if (errno == EINTR) continue;
            break; // EPIPE: the child stopped reading, its exit code tells the rest
        }
        total_written += static_cast<size_t>(n);
    }
    ::close(in_pipe[1]);

    Result result;
    if (capture_output) {
        char buf[4096];
        ssize_t n;
        while ((n = ::read(out_pipe[0], buf, sizeof(buf))) != 0) {
            if (n < 0) {
                if (errno == EINTR) continue;
                break;
            }
            result.output.append(buf, static_cast<size_t>(n));
        }
        ::close(out_pipe[0]);
    }

    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(sys_error("waitpid()"));
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else {
        result.exit_code = 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
    }

    if (result.exit_code == 127) {
        return std::unexpected(Error{ErrorCode::CommandFailed,
                                     std::format("{}: command not found", args[0])});
    }
    return result;
}

std::expected<int, Error> spawn_detached(const std::vector<std::string>& args) {
    if (args.empty()) return std::unexpected(Error{ErrorCode::CommandFailed, "empty command"});
    auto argv = make_argv(args);

    pid_t pid = ::fork();
    if (pid < 0) return std::unexpected(sys_error("fork()"));

    if (pid == 0) {
        reset_signal_mask();
        ::setsid();
        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDOUT_FILENO);
            ::dup2(devnull, STDERR_FILENO);
        }
        ::execvp(argv[0], argv.data());
        ::_exit(127);
    }
    return pid;
}

std::expected<int, Error> spawn_stage(const std::vector<std::string>& args, int stdin_fd, int stdout_fd) {
    if (args.empty()) return std::unexpected(Error{ErrorCode::CommandFailed, "empty command"});
    auto argv = make_argv(args);

    pid_t pid = ::fork();
    if (pid < 0) return std::unexpected(sys_error("fork()"));

    if (pid == 0) {
        reset_signal_mask();
        int devnull = ::open("/dev/null", O_RDWR);
        ::dup2(stdin_fd >= 0 ? stdin_fd : devnull, STDIN_FILENO);
        ::dup2(stdout_fd >= 0 ? stdout_fd : devnull, STDOUT_FILENO);
        ::dup2(devnull, STDERR_FILENO);
        ::execvp(argv[0], argv.data());
        ::_exit(127);
    }
    return pid;
}

std::expected<int, Error> wait_exit(int pid) {
    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(sys_error("waitpid()"));
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    return 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
}

} // namespace subprocess

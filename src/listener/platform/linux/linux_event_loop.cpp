#include "platform/linux/linux_event_loop.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/signalfd.h>
#include <unistd.h>

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose, std::string config_path)
    : verbose_(verbose),
      runtime_(std::move(config), verbose, std::move(config_path)),
      dispatcher_([this](const Action& action) { dispatch(action); }) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
}

bool LinuxEventLoop::init() {
    if (!runtime_.init()) return false;

    if (auto ok = dispatcher_.bind(runtime_.config().hotkeys); !ok) {
        std::println(stderr, "hotkeys: {}", ok.error().message);
        return false;
    }
    log(std::format("{} hotkeys bound", dispatcher_.binding_count()));

    if (!keyboards_.open_all()) return false;
    log(std::format("Listening on {} keyboard device(s)", keyboards_.fds().size()));

    // epoll setup
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Signal handling via signalfd
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigaddset(&mask, SIGCHLD);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    // Register FDs with epoll
    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    if (!add_fd(signal_fd_, EPOLLIN)) {
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    }
    for (int fd : keyboards_.fds()) {
        if (!add_fd(fd, EPOLLIN)) {
            std::println(stderr, "epoll_ctl failed for keyboard: {}", std::strerror(errno));
        }
    }

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                while (::read(signal_fd_, &info, sizeof(info)) == sizeof(info)) {
                    if (info.ssi_signo == SIGCHLD) {
                        runtime_.supervisor().reap_children();
                    } else {
                        log("Received signal, shutting down");
                        running_.store(false, std::memory_order_release);
                    }
                }
                continue;
            }

            // Keyboard fd
            bool alive = keyboards_.read_events(fd, [this](const input_event& ev) {
                if (ev.type == EV_KEY) {
                    dispatcher_.on_key(ev.code, ev.value);
                } else if (ev.type == EV_SYN && ev.code == SYN_DROPPED) {
                    dispatcher_.on_sync_dropped();
                }
            });
            if (!alive) {
                log("Keyboard device went away");
                epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
                keyboards_.close_device(fd);
                if (keyboards_.fds().empty()) {
                    std::println(stderr, "evdev: no keyboard left, exiting");
                    running_.store(false, std::memory_order_release);
                }
            }
        }
    }
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::dispatch(const Action& action) {
    log(std::format("Hotkey: {}", action_name(action.kind)));
    auto result = runtime_.controller().handle(action);
    if (result.outcome != Outcome::Ok) {
        log(std::format("{}: {}{}{}", action_name(action.kind), to_string(result.outcome),
                        result.message.empty() ? "" : ": ", result.message));
    }
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[dictate] {}", msg);
    }
}

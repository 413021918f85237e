#pragma once

#include "config.hpp"
#include "hotkey_dispatcher.hpp"
#include "platform/linux/evdev_keyboards.hpp"
#include "platform/linux/linux_runtime.hpp"

#include <atomic>
#include <string>

class LinuxEventLoop {
public:
    LinuxEventLoop(Config config, bool verbose = false, std::string config_path = {});
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

private:
    void dispatch(const Action& action);
    void log(const std::string& msg);

    bool verbose_;

    LinuxRuntime runtime_;
    EvdevKeyboards keyboards_;
    HotkeyDispatcher dispatcher_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;

    std::atomic<bool> running_{false};
};

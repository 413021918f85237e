#pragma once

#include <functional>
#include <linux/input.h>
#include <string>
#include <vector>

// The set of /dev/input/event* devices that can emit the keys we bind.
class EvdevKeyboards {
public:
    EvdevKeyboards() = default;
    ~EvdevKeyboards();

    EvdevKeyboards(const EvdevKeyboards&) = delete;
    EvdevKeyboards& operator=(const EvdevKeyboards&) = delete;

    // Opens every keyboard-like device under `dir`. False if none could be
    // opened (usually: user not in the `input` group).
    bool open_all(const std::string& dir = "/dev/input");

    const std::vector<int>& fds() const { return fds_; }

    // Drains pending events from fd. False once the device is gone.
    bool read_events(int fd, const std::function<void(const input_event&)>& on_event);

    void close_device(int fd);

private:
    static bool is_keyboard(int fd);

    std::vector<int> fds_;
};

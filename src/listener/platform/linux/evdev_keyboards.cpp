#include "platform/linux/evdev_keyboards.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <print>
#include <fcntl.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

constexpr size_t kBitsPerLong = sizeof(unsigned long) * 8;

bool test_bit(const unsigned long* bits, int bit) {
    return (bits[bit / kBitsPerLong] >> (bit % kBitsPerLong)) & 1UL;
}

} // namespace

EvdevKeyboards::~EvdevKeyboards() {
    for (int fd : fds_) ::close(fd);
}

bool EvdevKeyboards::open_all(const std::string& dir) {
    std::error_code ec;
    int denied = 0;

    for (auto& entry : fs::directory_iterator(dir, ec)) {
        auto name = entry.path().filename().string();
        if (!name.starts_with("event")) continue;

        int fd = ::open(entry.path().c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
        if (fd < 0) {
            if (errno == EACCES) denied++;
            continue;
        }
        if (!is_keyboard(fd)) {
            ::close(fd);
            continue;
        }
        fds_.push_back(fd);
    }

    if (ec) {
        std::println(stderr, "evdev: cannot list {}: {}", dir, ec.message());
    }
    if (fds_.empty()) {
        std::println(stderr, "evdev: no keyboard device could be opened{}",
                     denied ? " (add the user to the input group)" : "");
        return false;
    }
    return true;
}

bool EvdevKeyboards::read_events(int fd, const std::function<void(const input_event&)>& on_event) {
    input_event events[64];
    while (true) {
        ssize_t n = ::read(fd, events, sizeof(events));
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN) return true;
            // ENODEV: unplugged
            return false;
        }
        if (n == 0) return false;

        size_t count = static_cast<size_t>(n) / sizeof(input_event);
        for (size_t i = 0; i < count; i++) on_event(events[i]);
    }
}

void EvdevKeyboards::close_device(int fd) {
    auto it = std::find(fds_.begin(), fds_.end(), fd);
    if (it != fds_.end()) {
        ::close(fd);
        fds_.erase(it);
    }
}

bool EvdevKeyboards::is_keyboard(int fd) {
    unsigned long ev_bits[(EV_MAX + kBitsPerLong) / kBitsPerLong] = {};
    if (::ioctl(fd, EVIOCGBIT(0, sizeof(ev_bits)), ev_bits) < 0) return false;
    if (!test_bit(ev_bits, EV_KEY)) return false;

    unsigned long key_bits[(KEY_MAX + kBitsPerLong) / kBitsPerLong] = {};
    if (::ioctl(fd, EVIOCGBIT(EV_KEY, sizeof(key_bits)), key_bits) < 0) return false;

    // Mice and power buttons report EV_KEY too; a keyboard has letters.
    return test_bit(key_bits, KEY_A) && test_bit(key_bits, KEY_LEFTSHIFT);
}

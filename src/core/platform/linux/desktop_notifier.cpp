#include "platform/linux/desktop_notifier.hpp"

#include "platform/linux/subprocess.hpp"

#include <print>

DesktopNotifier::DesktopNotifier(bool enabled) : enabled_(enabled) {}

void DesktopNotifier::notify(const std::string& summary, const std::string& body) {
    std::println(stderr, "[dictate] {}: {}", summary, body);
    if (!enabled_) return;

    auto res = subprocess::run({"notify-send", "--app-name=dictate", summary, body});
    if (!res) {
        std::println(stderr, "notify: {}", res.error().message);
    }
}

#pragma once

#include "notify/notifier.hpp"

// notify-send; always mirrors the message to stderr.
class DesktopNotifier : public Notifier {
public:
    explicit DesktopNotifier(bool enabled);
    void notify(const std::string& summary, const std::string& body) override;

private:
    bool enabled_;
};

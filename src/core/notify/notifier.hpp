#pragma once

#include <string>

// User-visible side channel for failures.
class Notifier {
public:
    virtual ~Notifier() = default;
    virtual void notify(const std::string& summary, const std::string& body) = 0;
};

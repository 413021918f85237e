#pragma once

#include "error.hpp"

#include <expected>
#include <string>

// Secret lookup by key name. SecretNotFound when nothing is stored.
class CredentialStore {
public:
    virtual ~CredentialStore() = default;
    virtual std::expected<std::string, Error> lookup(const std::string& key) = 0;
};

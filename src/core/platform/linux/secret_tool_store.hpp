#pragma once

#include "credentials/credential_store.hpp"

// Asks the desktop keyring through `secret-tool lookup service dictate key
// <name>`, then this process's own environment. The secret is returned to the
// caller only; it is never exported to children.
class SecretToolStore : public CredentialStore {
public:
    std::expected<std::string, Error> lookup(const std::string& key) override;
};

#include "platform/linux/secret_tool_store.hpp"

#include "platform/linux/subprocess.hpp"

#include <cstdlib>

std::expected<std::string, Error> SecretToolStore::lookup(const std::string& key) {
    auto res = subprocess::run({"secret-tool", "lookup", "service", "dictate", "key", key}, {}, true);
    if (res && res->exit_code == 0) {
        auto secret = res->output;
        while (!secret.empty() && (secret.back() == '\n' || secret.back() == '\r')) secret.pop_back();
        if (!secret.empty()) return secret;
    }

    const char* env = std::getenv(key.c_str());
    if (env && *env) return std::string(env);

    return std::unexpected(Error{ErrorCode::SecretNotFound, key + " is not set in the keyring or environment"});
}

#pragma once

#include <string>
#include <string_view>

enum class ErrorCode {
    StateConflict,
    SpawnFailed,
    NotRunning,
    NotFound,
    Corrupt,
    Io,
    AuthError,
    NetworkError,
    EmptyAudio,
    NoFocusTarget,
    CommandFailed,
    SecretNotFound,
};

struct Error {
    ErrorCode code;
    std::string message;
};

constexpr std::string_view to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::StateConflict: return "state conflict";
        case ErrorCode::SpawnFailed: return "spawn failed";
        case ErrorCode::NotRunning: return "not running";
        case ErrorCode::NotFound: return "not found";
        case ErrorCode::Corrupt: return "corrupt";
        case ErrorCode::Io: return "i/o error";
        case ErrorCode::AuthError: return "authentication error";
        case ErrorCode::NetworkError: return "network error";
        case ErrorCode::EmptyAudio: return "empty audio";
        case ErrorCode::NoFocusTarget: return "no focus target";
        case ErrorCode::CommandFailed: return "command failed";
        case ErrorCode::SecretNotFound: return "secret not found";
    }
    return "unknown";
}

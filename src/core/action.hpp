#pragma once

#include <optional>
#include <string>
#include <string_view>

enum class ActionKind {
    StartRecording,
    StopRecording,
    NextParagraph,
    PrevParagraph,
    PauseResume,
    ToggleBackend,
    Speak,
    StopSpeaking,
    Status,
};

// A requested transition. `text` is only used by Speak.
struct Action {
    ActionKind kind;
    std::string text;
};

// Command-line / config names: "start-record", "stop-record", ...
std::string_view action_name(ActionKind kind);
std::optional<ActionKind> action_from_name(std::string_view name);

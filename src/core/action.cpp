#include "action.hpp"

#include <array>
#include <utility>

namespace {

constexpr std::array<std::pair<ActionKind, std::string_view>, 9> kNames = {{
    {ActionKind::StartRecording, "start-record"},
    {ActionKind::StopRecording, "stop-record"},
    {ActionKind::NextParagraph, "next-paragraph"},
    {ActionKind::PrevParagraph, "prev-paragraph"},
    {ActionKind::PauseResume, "pause-resume"},
    {ActionKind::ToggleBackend, "toggle-backend"},
    {ActionKind::Speak, "speak"},
    {ActionKind::StopSpeaking, "stop-speaking"},
    {ActionKind::Status, "status"},
}};

} // namespace

std::string_view action_name(ActionKind kind) {
    for (auto& [k, name] : kNames) {
        if (k == kind) return name;
    }
    return "unknown";
}

std::optional<ActionKind> action_from_name(std::string_view name) {
    for (auto& [k, n] : kNames) {
        if (n == name) return k;
    }
    return std::nullopt;
}

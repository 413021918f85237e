#pragma once

#include "config.hpp"
#include "mode_controller.hpp"
#include "feedback/beep_feedback.hpp"
#include "platform/linux/desktop_notifier.hpp"
#include "platform/linux/linux_process_supervisor.hpp"
#include "platform/linux/secret_tool_store.hpp"
#include "state_store.hpp"
#include "storage/history_db.hpp"
#include "transcription/openai_transcriber.hpp"

#include <memory>
#include <string>

// Wires the Linux collaborators into a ModeController. Shared by the CLI and
// the hotkey listener.
class LinuxRuntime {
public:
    LinuxRuntime(Config config, bool verbose, std::string config_path = {});

    LinuxRuntime(const LinuxRuntime&) = delete;
    LinuxRuntime& operator=(const LinuxRuntime&) = delete;

    // Creates the state directory and opens the history database.
    bool init();

    ModeController& controller() { return core_; }
    LinuxProcessSupervisor& supervisor() { return supervisor_; }
    HistoryDb& history() { return history_db_; }
    const StateStore& store() const { return store_; }
    const Config& config() const { return config_; }

    // argv that re-executes this binary as the player child.
    std::vector<std::string> player_command(Backend backend, int from_paragraph) const;

    static std::unique_ptr<OutputMethod> make_output(const Config& config);

private:
    void log(const std::string& msg);

    Config config_;
    bool verbose_;
    std::string config_path_;

    // Platform implementations (constructed before core_)
    StateStore store_;
    LinuxProcessSupervisor supervisor_;
    OpenAiTranscriber transcriber_;
    SecretToolStore credentials_;
    std::unique_ptr<OutputMethod> output_;
    DesktopNotifier notifier_;
    BeepFeedback feedback_;
    HistoryDb history_db_;

    ModeController core_;
};

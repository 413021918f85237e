#include "platform/linux/linux_runtime.hpp"

#include "platform/linux/wayland_paste_output.hpp"
#include "platform/linux/x11_paste_output.hpp"
#include "platform/platform_paths.hpp"

#include <filesystem>
#include <print>

namespace fs = std::filesystem;

namespace {

std::string resolve_state_dir(const Config& config) {
    return config.state_dir.empty() ? platform::runtime_dir() : config.state_dir;
}

} // namespace

LinuxRuntime::LinuxRuntime(Config config, bool verbose, std::string config_path)
    : config_(std::move(config)), verbose_(verbose), config_path_(std::move(config_path)),
      store_(resolve_state_dir(config_)),
      supervisor_(std::chrono::milliseconds(config_.session.spawn_grace_ms)),
      transcriber_(config_.transcription.url, config_.transcription.model,
                   config_.transcription.language, config_.transcription.timeout_s),
      output_(make_output(config_)),
      notifier_(config_.notify.enabled),
      feedback_(store_.dir(), config_.feedback.enabled),
      core_(config_, verbose_, store_, supervisor_, transcriber_, credentials_, *output_,
            notifier_, feedback_,
            [this](Backend backend, int from) { return player_command(backend, from); },
            &history_db_) {}

bool LinuxRuntime::init() {
    if (auto ok = store_.ensure_dir(); !ok) {
        std::println(stderr, "store: {}", ok.error().message);
        return false;
    }

    if (config_.history.enabled) {
        auto data = platform::data_dir();
        auto db_path = data.empty() ? std::string("/tmp/dictate/history.db") : data + "/history.db";
        if (!history_db_.open(db_path)) {
            std::println(stderr, "Warning: history DB failed to open, history disabled");
        }
    }

    log("State in " + store_.dir());
    return true;
}

std::vector<std::string> LinuxRuntime::player_command(Backend backend, int from_paragraph) const {
    std::vector<std::string> argv = {
        platform::cli_executable(), "play",
        "--backend", std::string(to_string(backend)),
        "--from", std::to_string(from_paragraph),
        "--state-dir", store_.dir(),
    };
    if (!config_path_.empty()) {
        argv.push_back("--config");
        argv.push_back(fs::absolute(config_path_).string());
    }
    if (verbose_) argv.push_back("--verbose");
    return argv;
}

std::unique_ptr<OutputMethod> LinuxRuntime::make_output(const Config& config) {
    if (config.output.display == "wayland") {
        return std::make_unique<WaylandPasteOutput>(config.output.terminal_shortcut);
    }
    return std::make_unique<X11PasteOutput>(config.output.terminals);
}

void LinuxRuntime::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[dictate] {}", msg);
    }
}

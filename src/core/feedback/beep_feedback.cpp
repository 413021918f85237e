#include "feedback/beep_feedback.hpp"

#include "feedback/wav_encoder.hpp"
#include "platform/linux/subprocess.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <print>

namespace fs = std::filesystem;

namespace {

constexpr uint32_t kToneRate = 16000;
constexpr double kToneVolume = 0.15;

} // namespace

BeepFeedback::BeepFeedback(std::string dir, bool enabled)
    : dir_(std::move(dir)), enabled_(enabled) {}

double BeepFeedback::frequency(Cue c) {
    switch (c) {
        case Cue::Start: return 880.0;
        case Cue::Stop: return 440.0;
        case Cue::Ready: return 660.0;
    }
    return 440.0;
}

void BeepFeedback::cue(Cue c) {
    if (!enabled_) return;

    auto path = ensure_tone(c);
    if (path.empty()) return;

    auto pid = subprocess::spawn_detached({"aplay", "-q", path});
    if (!pid) {
        std::println(stderr, "feedback: {}", pid.error().message);
    }
}

std::string BeepFeedback::ensure_tone(Cue c) {
    auto freq = frequency(c);
    auto path = fs::path(dir_) / std::format("beep-{}.wav", static_cast<int>(freq));

    std::error_code ec;
    if (fs::exists(path, ec)) return path.string();

    double duration = c == Cue::Ready ? 0.15 : 0.1;
    auto data = wav::encode(wav::tone(freq, duration, kToneVolume, kToneRate), kToneRate);

    std::ofstream out(path, std::ios::binary);
    if (!out.is_open()) {
        std::println(stderr, "feedback: cannot write {}", path.string());
        return {};
    }
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    return path.string();
}

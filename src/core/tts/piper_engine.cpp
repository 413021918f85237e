#include "tts/piper_engine.hpp"

#include "platform/linux/subprocess.hpp"
#include "tts/paragraphs.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

PiperEngine::PiperEngine(std::string model_en, std::string model_fr, uint32_t sample_rate)
    : model_en_(std::move(model_en)), model_fr_(std::move(model_fr)), sample_rate_(sample_rate) {}

std::expected<void, Error> PiperEngine::speak(const std::string& paragraph) {
    const auto& model = detect_language(paragraph) == "fr" ? model_fr_ : model_en_;

    int text_pipe[2];
    int audio_pipe[2];
    if (::pipe2(text_pipe, O_CLOEXEC) < 0) {
        return std::unexpected(Error{ErrorCode::CommandFailed, std::string("pipe() failed: ") + std::strerror(errno)});
    }
    if (::pipe2(audio_pipe, O_CLOEXEC) < 0) {
        ::close(text_pipe[0]);
        ::close(text_pipe[1]);
        return std::unexpected(Error{ErrorCode::CommandFailed, std::string("pipe() failed: ") + std::strerror(errno)});
    }

    auto piper = subprocess::spawn_stage({"piper", "--model", model, "--output-raw"},
                                         text_pipe[0], audio_pipe[1]);
    ::close(text_pipe[0]);
    ::close(audio_pipe[1]);
    if (!piper) {
        ::close(text_pipe[1]);
        ::close(audio_pipe[0]);
        return std::unexpected(piper.error());
    }

    auto aplay = subprocess::spawn_stage({"aplay", "-q", "-r", std::to_string(sample_rate_),
                                          "-f", "S16_LE", "-c", "1", "-t", "raw"},
                                         audio_pipe[0], -1);
    ::close(audio_pipe[0]);
    if (!aplay) {
        ::close(text_pipe[1]);
        (void)subprocess::wait_exit(*piper);
        return std::unexpected(aplay.error());
    }

    size_t total_written = 0;
    while (total_written < paragraph.size()) {
        ssize_t n = ::write(text_pipe[1], paragraph.data() + total_written, paragraph.size() - total_written);
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        total_written += static_cast<size_t>(n);
    }
    ::close(text_pipe[1]);

    auto piper_code = subprocess::wait_exit(*piper);
    auto aplay_code = subprocess::wait_exit(*aplay);
    if (!piper_code) return std::unexpected(piper_code.error());
    if (!aplay_code) return std::unexpected(aplay_code.error());

    if (*piper_code != 0) {
        return std::unexpected(Error{ErrorCode::CommandFailed,
                                     "piper exited with code " + std::to_string(*piper_code)});
    }
    if (*aplay_code != 0) {
        return std::unexpected(Error{ErrorCode::CommandFailed,
                                     "aplay exited with code " + std::to_string(*aplay_code)});
    }
    return {};
}

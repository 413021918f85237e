#include "tts/openai_speech_engine.hpp"

#include "platform/linux/subprocess.hpp"

#include <cerrno>
#include <cstring>
#include <curl/curl.h>
#include <fcntl.h>
#include <nlohmann/json.hpp>
#include <unistd.h>

using json = nlohmann::json;

namespace {

// Forwards the response body to aplay's stdin. Returning short aborts the
// transfer, which is what we want once aplay has gone away.
size_t pipe_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    int fd = *static_cast<int*>(userdata);
    size_t total = size * nmemb;
    size_t written = 0;
    while (written < total) {
        ssize_t n = ::write(fd, ptr + written, total - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return written;
        }
        written += static_cast<size_t>(n);
    }
    return total;
}

} // namespace

OpenAiSpeechEngine::OpenAiSpeechEngine(std::string url, std::string model, std::string voice,
                                       std::string credential_key, CredentialStore& credentials)
    : url_(std::move(url)), model_(std::move(model)), voice_(std::move(voice)),
      credential_key_(std::move(credential_key)), credentials_(credentials) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

OpenAiSpeechEngine::~OpenAiSpeechEngine() {
    curl_global_cleanup();
}

std::expected<void, Error> OpenAiSpeechEngine::speak(const std::string& paragraph) {
    auto secret = credentials_.lookup(credential_key_);
    if (!secret) return std::unexpected(secret.error());

    int audio_pipe[2];
    if (::pipe2(audio_pipe, O_CLOEXEC) < 0) {
        return std::unexpected(Error{ErrorCode::CommandFailed, std::string("pipe() failed: ") + std::strerror(errno)});
    }

    auto aplay = subprocess::spawn_stage({"aplay", "-q"}, audio_pipe[0], -1);
    ::close(audio_pipe[0]);
    if (!aplay) {
        ::close(audio_pipe[1]);
        return std::unexpected(aplay.error());
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        ::close(audio_pipe[1]);
        (void)subprocess::wait_exit(*aplay);
        return std::unexpected(Error{ErrorCode::NetworkError, "curl_easy_init failed"});
    }

    std::string body = json{
        {"model", model_},
        {"voice", voice_},
        {"input", paragraph},
        {"response_format", "wav"},
    }.dump();

    std::string auth = "Authorization: Bearer " + *secret;
    curl_slist* headers = curl_slist_append(nullptr, auth.c_str());
    headers = curl_slist_append(headers, "Content-Type: application/json");

    int out_fd = audio_pipe[1];
    curl_easy_setopt(curl, CURLOPT_URL, url_.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, pipe_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &out_fd);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);

    CURLcode res = curl_easy_perform(curl);
    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    ::close(audio_pipe[1]);

    auto aplay_code = subprocess::wait_exit(*aplay);

    if (http_code == 401 || http_code == 403) {
        return std::unexpected(Error{ErrorCode::AuthError,
                                     "speech provider rejected credential (HTTP " + std::to_string(http_code) + ")"});
    }
    if (res != CURLE_OK) {
        return std::unexpected(Error{ErrorCode::NetworkError,
                                     std::string("curl error: ") + curl_easy_strerror(res)});
    }
    if (!aplay_code) return std::unexpected(aplay_code.error());
    if (*aplay_code != 0) {
        return std::unexpected(Error{ErrorCode::CommandFailed,
                                     "aplay exited with code " + std::to_string(*aplay_code)});
    }
    return {};
}

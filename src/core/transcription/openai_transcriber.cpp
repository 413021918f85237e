#include "transcription/openai_transcriber.hpp"

#include "feedback/wav_encoder.hpp"

#include <array>
#include <chrono>
#include <curl/curl.h>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

OpenAiTranscriber::OpenAiTranscriber(std::string url, std::string model, std::string language,
                                     long timeout_s)
    : url_(std::move(url)), model_(std::move(model)),
      language_(std::move(language)), timeout_s_(timeout_s) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

OpenAiTranscriber::~OpenAiTranscriber() {
    curl_global_cleanup();
}

std::expected<TranscriptResult, Error>
OpenAiTranscriber::transcribe(const std::string& audio_path, const std::string& credential) {
    std::error_code ec;
    auto file_size = fs::file_size(audio_path, ec);
    if (ec || file_size <= 44) {
        return std::unexpected(Error{ErrorCode::EmptyAudio, "no audio captured"});
    }

    double duration_s = 0.0;
    {
        std::array<uint8_t, 44> header{};
        std::ifstream f(audio_path, std::ios::binary);
        f.read(reinterpret_cast<char*>(header.data()), header.size());
        if (auto d = wav::duration_seconds(header, file_size)) duration_s = *d;
    }

    auto start = std::chrono::steady_clock::now();

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected(Error{ErrorCode::NetworkError, "curl_easy_init failed"});
    }

    curl_mime* mime = curl_mime_init(curl);
    curl_mimepart* part;

    part = curl_mime_addpart(mime);
    curl_mime_name(part, "file");
    curl_mime_filedata(part, audio_path.c_str());
    curl_mime_filename(part, "audio.wav");
    curl_mime_type(part, "audio/wav");

    part = curl_mime_addpart(mime);
    curl_mime_name(part, "model");
    curl_mime_data(part, model_.c_str(), CURL_ZERO_TERMINATED);

    part = curl_mime_addpart(mime);
    curl_mime_name(part, "response_format");
    curl_mime_data(part, "json", CURL_ZERO_TERMINATED);

    if (!language_.empty()) {
        part = curl_mime_addpart(mime);
        curl_mime_name(part, "language");
        curl_mime_data(part, language_.c_str(), CURL_ZERO_TERMINATED);
    }

    std::string auth = "Authorization: Bearer " + credential;
    curl_slist* headers = curl_slist_append(nullptr, auth.c_str());

    std::string response_body;

    curl_easy_setopt(curl, CURLOPT_URL, url_.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_s_);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);

    CURLcode res = curl_easy_perform(curl);
    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    curl_slist_free_all(headers);
    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    auto end = std::chrono::steady_clock::now();
    double processing_s = std::chrono::duration<double>(end - start).count();

    if (res != CURLE_OK) {
        return std::unexpected(Error{ErrorCode::NetworkError,
                                     std::string("curl error: ") + curl_easy_strerror(res)});
    }
    if (http_code == 401 || http_code == 403) {
        return std::unexpected(Error{ErrorCode::AuthError,
                                     "provider rejected credential (HTTP " + std::to_string(http_code) + ")"});
    }
    if (http_code < 200 || http_code >= 300) {
        return std::unexpected(Error{ErrorCode::NetworkError,
                                     "HTTP " + std::to_string(http_code) + ": " + response_body});
    }

    try {
        auto j = json::parse(response_body);
        std::string text;

        if (j.contains("text")) {
            text = j["text"].get<std::string>();
        } else if (j.contains("error")) {
            return std::unexpected(Error{ErrorCode::NetworkError, "server error: " + j["error"].dump()});
        } else {
            return std::unexpected(Error{ErrorCode::NetworkError, "unexpected response: " + response_body});
        }

        // Trim whitespace
        auto start_pos = text.find_first_not_of(" \t\n\r");
        auto end_pos = text.find_last_not_of(" \t\n\r");
        if (start_pos == std::string::npos) {
            text.clear();
        } else {
            text = text.substr(start_pos, end_pos - start_pos + 1);
        }

        return TranscriptResult{
            .text = std::move(text),
            .duration_s = duration_s,
            .processing_s = processing_s,
        };
    } catch (const json::exception& e) {
        return std::unexpected(Error{ErrorCode::NetworkError, std::string("JSON parse error: ") + e.what()});
    }
}

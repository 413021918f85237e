#include <catch2/catch_test_macros.hpp>

#include "feedback/beep_feedback.hpp"
#include "feedback/wav_encoder.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <cstring>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// Read a little-endian uint16 from raw bytes.
uint16_t read_u16(const uint8_t* p) {
    uint16_t v;
    std::memcpy(&v, p, 2);
    return v;
}

// Read a little-endian uint32 from raw bytes.
uint32_t read_u32(const uint8_t* p) {
    uint32_t v;
    std::memcpy(&v, p, 4);
    return v;
}

std::string read_tag(const uint8_t* p) {
    return {reinterpret_cast<const char*>(p), 4};
}

} // namespace

TEST_CASE("wav::encode", "[wav]") {
    constexpr uint32_t sample_rate = 16000;
    std::vector<int16_t> samples = {0, 100, -100, 32767, -32768};

    SECTION("HeaderMagic") {
        auto wav = wav::encode(samples, sample_rate);
        REQUIRE(read_tag(wav.data()) == "RIFF");
        REQUIRE(read_tag(wav.data() + 8) == "WAVE");
        REQUIRE(read_tag(wav.data() + 12) == "fmt ");
        REQUIRE(read_tag(wav.data() + 36) == "data");
    }

    SECTION("HeaderSize") {
        auto wav = wav::encode(samples, sample_rate);
        REQUIRE(wav.size() == 44 + samples.size() * 2);
    }

    SECTION("HeaderFields") {
        auto wav = wav::encode(samples, sample_rate);

        // fmt chunk size
        REQUIRE(read_u32(wav.data() + 16) == 16);
        // PCM format
        REQUIRE(read_u16(wav.data() + 20) == 1);
        // channels
        REQUIRE(read_u16(wav.data() + 22) == 1);
        // sample rate
        REQUIRE(read_u32(wav.data() + 24) == sample_rate);
        // byte rate = sample_rate * channels * bits/8
        REQUIRE(read_u32(wav.data() + 28) == sample_rate * 1 * 16 / 8);
        // block align
        REQUIRE(read_u16(wav.data() + 32) == 2);
        // bits per sample
        REQUIRE(read_u16(wav.data() + 34) == 16);
        // data chunk size
        uint32_t data_size = static_cast<uint32_t>(samples.size() * 2);
        REQUIRE(read_u32(wav.data() + 40) == data_size);
        // RIFF chunk size = file_size - 8 = 36 + data_size
        REQUIRE(read_u32(wav.data() + 4) == 36 + data_size);
    }

    SECTION("DataIntegrity") {
        auto wav = wav::encode(samples, sample_rate);
        auto* data_ptr = reinterpret_cast<const int16_t*>(wav.data() + 44);
        for (size_t i = 0; i < samples.size(); ++i) {
            REQUIRE(data_ptr[i] == samples[i]);
        }
    }

    SECTION("EmptySamples") {
        std::vector<int16_t> empty;
        auto wav = wav::encode(empty, sample_rate);
        REQUIRE(wav.size() == 44);
        REQUIRE(read_u32(wav.data() + 40) == 0);
    }
}

TEST_CASE("wav::tone", "[wav]") {
    constexpr uint32_t rate = 16000;

    SECTION("Length") {
        REQUIRE(wav::tone(880.0, 0.1, 0.15, rate).size() == 1600);
        REQUIRE(wav::tone(440.0, 0.0, 0.15, rate).empty());
    }

    SECTION("StartsAtZeroCrossing") {
        auto samples = wav::tone(440.0, 0.1, 0.5, rate);
        REQUIRE(samples[0] == 0);
    }

    SECTION("PeakBoundedByVolume") {
        auto samples = wav::tone(660.0, 0.1, 0.15, rate);
        auto [lo, hi] = std::minmax_element(samples.begin(), samples.end());
        REQUIRE(*hi <= static_cast<int16_t>(32767 * 0.15) + 1);
        REQUIRE(*lo >= -static_cast<int16_t>(32767 * 0.15) - 1);
        // A 660 Hz tone over 0.1s swings well away from silence.
        REQUIRE(*hi > 4000);
    }
}

TEST_CASE("wav::duration_seconds", "[wav]") {
    std::vector<int16_t> one_second(16000, 0);
    auto data = wav::encode(one_second, 16000);

    SECTION("FromHeaderAndSize") {
        auto d = wav::duration_seconds(data, data.size());
        REQUIRE(d.has_value());
        REQUIRE(*d == 1.0);
    }

    SECTION("HeaderOnlyIsZero") {
        auto d = wav::duration_seconds(data, 44);
        REQUIRE(d.has_value());
        REQUIRE(*d == 0.0);
    }

    SECTION("RejectsNonWav") {
        std::vector<uint8_t> junk(44, 'x');
        REQUIRE_FALSE(wav::duration_seconds(junk, 1000).has_value());
        REQUIRE_FALSE(wav::duration_seconds(std::span(data).first(10), 1000).has_value());
    }
}

TEST_CASE("BeepFeedback", "[feedback]") {
    auto dir = std::filesystem::temp_directory_path() /
               ("dictate_test_beep_" + std::to_string(::getpid()));
    std::filesystem::create_directories(dir);

    SECTION("CueFrequencies") {
        REQUIRE(BeepFeedback::frequency(Cue::Start) == 880.0);
        REQUIRE(BeepFeedback::frequency(Cue::Stop) == 440.0);
        REQUIRE(BeepFeedback::frequency(Cue::Ready) == 660.0);
    }

    SECTION("DisabledWritesNothing") {
        BeepFeedback feedback(dir.string(), false);
        feedback.cue(Cue::Start);
        REQUIRE_FALSE(std::filesystem::exists(dir / "beep-880.wav"));
    }

    SECTION("GeneratesToneOnFirstUse") {
        BeepFeedback feedback(dir.string(), true);
        feedback.cue(Cue::Stop);

        auto path = dir / "beep-440.wav";
        REQUIRE(std::filesystem::exists(path));
        // 0.1s of 16 kHz mono PCM behind a 44-byte header
        REQUIRE(std::filesystem::file_size(path) == 44 + 1600 * 2);
    }

    std::filesystem::remove_all(dir);
}

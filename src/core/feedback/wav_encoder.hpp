#pragma once

#include <cmath>
#include <cstdint>
#include <cstring>
#include <numbers>
#include <optional>
#include <span>
#include <vector>

// Encodes raw PCM int16 samples into a WAV file in memory.
namespace wav {

inline std::vector<uint8_t> encode(std::span<const int16_t> samples, uint32_t sample_rate) {
    constexpr uint16_t channels = 1;
    constexpr uint16_t bits_per_sample = 16;
    uint32_t byte_rate = sample_rate * channels * bits_per_sample / 8;
    uint16_t block_align = channels * bits_per_sample / 8;
    uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));
    uint32_t file_size = 36 + data_size;

    std::vector<uint8_t> out(44 + data_size);
    auto w = [&out, pos = size_t(0)](const void* data, size_t len) mutable {
        std::memcpy(out.data() + pos, data, len);
        pos += len;
    };
    auto w16 = [&w](uint16_t v) { w(&v, 2); };
    auto w32 = [&w](uint32_t v) { w(&v, 4); };

    w("RIFF", 4);
    w32(file_size);
    w("WAVE", 4);
    w("fmt ", 4);
    w32(16);                // subchunk1 size
    w16(1);                 // PCM format
    w16(channels);
    w32(sample_rate);
    w32(byte_rate);
    w16(block_align);
    w16(bits_per_sample);
    w("data", 4);
    w32(data_size);
    if (data_size > 0) std::memcpy(out.data() + 44, samples.data(), data_size);

    return out;
}

// Mono sine tone, `volume` in [0, 1] of full scale.
inline std::vector<int16_t> tone(double freq_hz, double duration_s, double volume,
                                 uint32_t sample_rate) {
    auto n = static_cast<size_t>(sample_rate * duration_s);
    std::vector<int16_t> samples(n);
    for (size_t i = 0; i < n; i++) {
        double t = static_cast<double>(i) / sample_rate;
        samples[i] = static_cast<int16_t>(std::sin(2.0 * std::numbers::pi * freq_hz * t) * 32767.0 * volume);
    }
    return samples;
}

// Audio length of a canonical 44-byte-header PCM WAV, from its header and
// total size. Empty if the header is not one we recognise.
inline std::optional<double> duration_seconds(std::span<const uint8_t> header, uint64_t file_size) {
    if (header.size() < 44 || std::memcmp(header.data(), "RIFF", 4) != 0 ||
        std::memcmp(header.data() + 8, "WAVE", 4) != 0) {
        return std::nullopt;
    }
    uint32_t byte_rate;
    std::memcpy(&byte_rate, header.data() + 28, 4);
    if (byte_rate == 0 || file_size < 44) return std::nullopt;
    return static_cast<double>(file_size - 44) / byte_rate;
}

} // namespace wav

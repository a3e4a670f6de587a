#pragma once

#include <cstdint>
#include <cstring>
#include <expected>
#include <fstream>
#include <iterator>
#include <span>
#include <string>
#include <vector>

// RIFF/WAVE encoding of mono PCM. Writes 32-bit IEEE float; reads float32
// and int16.
namespace wav {

struct Audio {
    std::vector<float> samples; // interleaved when channels > 1
    uint32_t sample_rate = 0;
    uint16_t channels = 0;
};

inline std::vector<uint8_t> encode_f32(std::span<const float> samples, uint32_t sample_rate,
                                       uint16_t channels = 1) {
    constexpr uint16_t bits_per_sample = 32;
    uint32_t byte_rate = sample_rate * channels * bits_per_sample / 8;
    uint16_t block_align = channels * bits_per_sample / 8;
    uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(float));
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
    w32(16);
    w16(3);                 // IEEE float
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

inline std::expected<Audio, std::string> decode(std::span<const uint8_t> bytes) {
    auto r16 = [&bytes](size_t pos) { uint16_t v; std::memcpy(&v, bytes.data() + pos, 2); return v; };
    auto r32 = [&bytes](size_t pos) { uint32_t v; std::memcpy(&v, bytes.data() + pos, 4); return v; };

    if (bytes.size() < 12 || std::memcmp(bytes.data(), "RIFF", 4) != 0 ||
        std::memcmp(bytes.data() + 8, "WAVE", 4) != 0) {
        return std::unexpected("wav: not a RIFF/WAVE file");
    }

    uint16_t format = 0, bits = 0;
    Audio audio;
    bool have_fmt = false;

    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        uint32_t chunk_size = r32(pos + 4);
        size_t body = pos + 8;
        if (body + chunk_size > bytes.size()) {
            return std::unexpected("wav: truncated chunk");
        }

        if (std::memcmp(bytes.data() + pos, "fmt ", 4) == 0) {
            if (chunk_size < 16) return std::unexpected("wav: short fmt chunk");
            format = r16(body);
            audio.channels = r16(body + 2);
            audio.sample_rate = r32(body + 4);
            bits = r16(body + 14);
            have_fmt = true;
        } else if (std::memcmp(bytes.data() + pos, "data", 4) == 0) {
            if (!have_fmt) return std::unexpected("wav: data before fmt");
            if (format == 3 && bits == 32) {
                audio.samples.resize(chunk_size / 4);
                std::memcpy(audio.samples.data(), bytes.data() + body, audio.samples.size() * 4);
            } else if (format == 1 && bits == 16) {
                audio.samples.resize(chunk_size / 2);
                for (size_t i = 0; i < audio.samples.size(); ++i) {
                    auto s = static_cast<int16_t>(r16(body + i * 2));
                    audio.samples[i] = static_cast<float>(s) / 32768.0f;
                }
            } else {
                return std::unexpected("wav: unsupported sample format");
            }
            return audio;
        }

        pos = body + chunk_size + (chunk_size & 1);
    }
    return std::unexpected("wav: no data chunk");
}

inline std::expected<void, std::string> write_file(const std::string& path, std::span<const float> samples,
                                                   uint32_t sample_rate) {
    auto bytes = encode_f32(samples, sample_rate);
    std::ofstream f(path, std::ios::binary);
    if (!f.is_open()) return std::unexpected("wav: cannot write " + path);
    f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!f) return std::unexpected("wav: write failed for " + path);
    return {};
}

inline std::expected<Audio, std::string> read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) return std::unexpected("wav: cannot open " + path);
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return decode(bytes);
}

} // namespace wav

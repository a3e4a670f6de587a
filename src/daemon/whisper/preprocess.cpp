#include "whisper/preprocess.hpp"

#include "audio/vad.hpp"

#include <algorithm>
#include <cmath>

namespace preprocess {

namespace {

constexpr uint32_t kWindowMs = 20;

struct Bounds {
    size_t start;
    size_t end;
};

// Sample range [start, end) covered by the first and last loud windows.
// start >= end when nothing is loud.
Bounds speech_bounds(std::span<const float> audio, size_t window, float threshold) {
    size_t n_windows = audio.size() / window;
    size_t first = n_windows;
    size_t last = 0;
    for (size_t w = 0; w < n_windows; ++w) {
        if (vad::rms(audio.subspan(w * window, window)) > threshold) {
            if (first == n_windows) first = w;
            last = w;
        }
    }
    if (first == n_windows) return {0, 0};
    return {first * window, std::min(audio.size(), (last + 1) * window)};
}

} // namespace

void normalize_peak(std::span<float> audio) {
    float peak = 0.0f;
    for (float s : audio) peak = std::max(peak, std::fabs(s));
    if (peak <= kMinPeak || peak >= kTargetPeak) return;

    float gain = kTargetPeak / peak;
    for (float& s : audio) s = std::clamp(s * gain, -kTargetPeak, kTargetPeak);
}

std::span<const float> trim_silence(std::span<const float> audio, uint32_t sample_rate,
                                    float threshold) {
    size_t window = static_cast<size_t>(sample_rate) * kWindowMs / 1000;
    if (window == 0 || audio.size() < window) return audio;

    auto b = speech_bounds(audio, window, threshold);
    if (b.start >= b.end) return {};
    return audio.subspan(b.start, b.end - b.start);
}

std::span<const float> trim_silence_padded(std::span<const float> audio, uint32_t sample_rate,
                                           float threshold, float padding_s) {
    size_t window = static_cast<size_t>(sample_rate) * kWindowMs / 1000;
    if (window == 0 || audio.size() < window) return audio;

    auto b = speech_bounds(audio, window, threshold);
    if (b.start >= b.end) return {};

    size_t pad = static_cast<size_t>(std::lround(padding_s * static_cast<float>(sample_rate)));
    size_t start = b.start > pad ? b.start - pad : 0;
    size_t end = std::min(audio.size(), b.end + pad);
    return audio.subspan(start, end - start);
}

} // namespace preprocess

#pragma once

#include <cstdint>
#include <span>

// Signal conditioning applied before every decode.
namespace preprocess {

constexpr float kTargetPeak = 0.95f;
constexpr float kMinPeak = 0.001f;
constexpr float kTrimThreshold = 0.01f;

// Scales to kTargetPeak when the current peak lies in (kMinPeak, kTargetPeak).
void normalize_peak(std::span<float> audio);

// Keeps the span from the first to the last 20ms window whose RMS exceeds
// `threshold`. Returns an empty span when no window does. Inputs shorter
// than one window come back unchanged.
std::span<const float> trim_silence(std::span<const float> audio, uint32_t sample_rate,
                                    float threshold = kTrimThreshold);

// Same as trim_silence but keeps `padding_s` of audio on both sides of the
// detected speech, clamped to the input.
std::span<const float> trim_silence_padded(std::span<const float> audio, uint32_t sample_rate,
                                           float threshold, float padding_s);

} // namespace preprocess

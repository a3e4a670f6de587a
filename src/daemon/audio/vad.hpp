#pragma once

#include <chrono>
#include <optional>
#include <span>

namespace vad {

using Clock = std::chrono::steady_clock;

float rms(std::span<const float> samples);

struct Params {
    float threshold = 0.015f;
    float min_speech_s = 0.5f;
};

// Per-stream speech/silence timers. Owned by the caller and passed into
// every step, so one struct drives both the capture callback and the
// session poll loop.
struct State {
    bool speech_detected = false;
    std::optional<Clock::time_point> speech_start;  // start of the current loud run
    std::optional<Clock::time_point> silence_start; // first quiet frame after speech
};

// Feeds one level reading taken at `now`.
// Speech is confirmed once the level stays above threshold for min_speech_s.
// Returns the length of the current silence run in seconds (0 while speaking
// or before speech was ever confirmed).
double step(State& state, float level, Clock::time_point now, const Params& params);

} // namespace vad

#include "audio/vad.hpp"

#include <cmath>

namespace vad {

float rms(std::span<const float> samples) {
    if (samples.empty()) return 0.0f;
    double sum = 0.0;
    for (float s : samples) sum += static_cast<double>(s) * s;
    return static_cast<float>(std::sqrt(sum / static_cast<double>(samples.size())));
}

double step(State& state, float level, Clock::time_point now, const Params& params) {
    if (level > params.threshold) {
        state.silence_start.reset();
        if (!state.speech_start) state.speech_start = now;
        if (!state.speech_detected &&
            std::chrono::duration<double>(now - *state.speech_start).count() >= params.min_speech_s) {
            state.speech_detected = true;
        }
        return 0.0;
    }

    // Brief bursts below the dwell time never count as speech.
    state.speech_start.reset();
    if (!state.speech_detected) return 0.0;

    if (!state.silence_start) {
        state.silence_start = now;
        return 0.0;
    }
    return std::chrono::duration<double>(now - *state.silence_start).count();
}

} // namespace vad

#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>

struct WakeDetection {
    std::string name;
    float score = 0.0f;
    float avg_score = 0.0f;
    uint32_t hits = 0;
};

// Decides whether a wake phrase occurs in the audio captured since the
// previous call. Implementations may keep state across calls.
class WakeMatcher {
public:
    virtual ~WakeMatcher() = default;
    virtual std::optional<WakeDetection> process(std::span<const float> samples) = 0;
    virtual void reset() = 0;
    // Seconds of audio to gather between process() calls.
    virtual float stride_s() const = 0;
};

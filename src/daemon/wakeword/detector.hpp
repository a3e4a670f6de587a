#pragma once

#include "audio/audio_capture.hpp"
#include "audio/vad.hpp"
#include "wakeword/matcher.hpp"

#include <atomic>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

// Always-on listener: hands each stride of captured audio to a matcher and
// fires the callback on a match, then ignores audio for the cooldown.
class WakeWordDetector {
public:
    using Clock = vad::Clock;
    using WakeCallback = std::function<void(const WakeDetection&)>;

    WakeWordDetector(AudioCapture& capture, std::unique_ptr<WakeMatcher> matcher,
                     float cooldown_s, bool verbose = false);

    // Analyzes everything captured since the previous poll. Returns true when
    // on_wake ran.
    bool poll(Clock::time_point now, const WakeCallback& on_wake);

    // Opens a continuous stream and polls once per matcher stride until `st`
    // is stopped.
    std::expected<void, std::string> listen(std::stop_token st, const WakeCallback& on_wake);

    // While paused the buffer is discarded and nothing is matched.
    void set_paused(bool paused) { paused_.store(paused, std::memory_order_release); }
    bool paused() const { return paused_.load(std::memory_order_acquire); }

private:
    AudioCapture& capture_;
    std::unique_ptr<WakeMatcher> matcher_;
    std::chrono::duration<double> cooldown_;
    bool verbose_;

    std::atomic<bool> paused_{false};
    bool was_paused_ = false;
    std::optional<Clock::time_point> last_activation_;
};

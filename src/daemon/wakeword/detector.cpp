#include "wakeword/detector.hpp"

#include <chrono>
#include <print>
#include <thread>

WakeWordDetector::WakeWordDetector(AudioCapture& capture, std::unique_ptr<WakeMatcher> matcher,
                                   float cooldown_s, bool verbose)
    : capture_(capture), matcher_(std::move(matcher)), cooldown_(cooldown_s), verbose_(verbose) {}

bool WakeWordDetector::poll(Clock::time_point now, const WakeCallback& on_wake) {
    if (paused()) {
        capture_.clear_buffer();
        was_paused_ = true;
        return false;
    }
    if (was_paused_) {
        // Audio from before the pause is stale
        matcher_->reset();
        was_paused_ = false;
    }

    if (last_activation_ && now - *last_activation_ < cooldown_) {
        capture_.clear_buffer();
        return false;
    }

    auto samples = capture_.take();
    auto detection = matcher_->process(samples);
    if (!detection) return false;

    if (verbose_) {
        std::println(stderr, "[kiri] wake word detected: \"{}\" (score {:.2f}, avg {:.2f}, hits {})",
                     detection->name, detection->score, detection->avg_score, detection->hits);
    }
    last_activation_ = now;
    matcher_->reset();
    on_wake(*detection);
    return true;
}

std::expected<void, std::string> WakeWordDetector::listen(std::stop_token st, const WakeCallback& on_wake) {
    auto stream = capture_.start_continuous();
    if (!stream) {
        return std::unexpected(stream.error());
    }

    auto stride = std::chrono::duration<float>(matcher_->stride_s());
    while (!st.stop_requested()) {
        std::this_thread::sleep_for(stride);
        if (st.stop_requested()) break;

        if (auto err = capture_.last_error(); !err.empty()) {
            return std::unexpected("audio: " + err);
        }
        poll(Clock::now(), on_wake);
    }
    return {};
}

#include "session/streaming_session.hpp"

#include "audio/resampler.hpp"
#include "session/hallucination.hpp"

#include <chrono>
#include <format>
#include <print>
#include <thread>

using namespace std::chrono_literals;

namespace {

constexpr auto kLevelInterval = 60ms;
constexpr auto kErrorLinger = 3s;
constexpr double kPartialMinAudio = 1.0; // seconds buffered before a preview

std::string trimmed(std::string s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

double seconds(vad::Clock::duration d) {
    return std::chrono::duration<double>(d).count();
}

} // namespace

StreamingSession::StreamingSession(Config config, AudioCapture& capture, ModelLoader loader,
                                   EventChannel<SessionEvent>& events, bool verbose)
    : config_(std::move(config)), capture_(capture), loader_(std::move(loader)),
      events_(events), verbose_(verbose) {}

StreamingSession::~StreamingSession() {
    stream_.release();
    if (accurate_future_.valid()) accurate_future_.wait();
}

std::expected<void, std::string> StreamingSession::start(Clock::time_point now) {
    set_state(SessionState::Loading);
    last_decode_ = now;

    const auto& lang = config_.model.language;

    auto fast = loader_(config_.fast_model_path());
    if (fast) {
        fast_.emplace(*fast, lang, verbose_);
        // Listening starts right away; the accurate model arrives later
        accurate_future_ = std::async(std::launch::async, loader_, config_.accurate_model_path());
    } else {
        log("fast model unavailable (" + fast.error() + "), waiting for accurate model");
        auto accurate = loader_(config_.accurate_model_path());
        if (!accurate) {
            fail("Model load failed: " + accurate.error());
            return std::unexpected(accurate.error());
        }
        fast_.emplace(*accurate, lang, verbose_);
        accurate_.emplace(*accurate, lang, verbose_);
    }

    auto stream = capture_.start_continuous();
    if (!stream) {
        fail("Audio error: " + stream.error());
        return std::unexpected(stream.error());
    }
    stream_ = std::move(*stream);

    set_state(SessionState::Listening);
    return {};
}

bool StreamingSession::tick(Clock::time_point now) {
    if (cancelled()) return false;
    if (state() == SessionState::Error || !fast_) return false;

    poll_accurate_model();

    const auto& s = config_.session;
    vad::Params vp{.threshold = config_.audio.speech_threshold,
                   .min_speech_s = config_.audio.speech_min_s};

    float level = capture_.level();
    double segment_silence = vad::step(vad_, level, now, vp);
    if (vad_.speech_detected && level > vp.threshold) {
        had_speech_ = true;
        new_speech_ = true;
        last_speech_ = now;
    }

    if (had_speech_ && last_speech_ && seconds(now - *last_speech_) >= s.done_timeout_s) {
        log("silence timeout, ending session");
        return false;
    }

    double duration = static_cast<double>(capture_.buffered_samples()) / config_.audio.capture_rate;

    if (duration >= s.max_session_s) {
        log("maximum duration reached");
        if (duration >= s.min_segment_s) finalize_segment(now);
        return false;
    }

    if (vad_.speech_detected && segment_silence >= s.segment_silence_s && duration >= s.min_segment_s) {
        finalize_segment(now);
        set_state(SessionState::Listening);
        return true;
    }

    if (new_speech_ && duration >= kPartialMinAudio && seconds(now - last_decode_) >= s.partial_interval_s) {
        partial_decode(now);
    }
    return true;
}

void StreamingSession::finish() {
    stream_.release();
    state_.store(SessionState::Result, std::memory_order_release);

    std::string result = transcript_.empty() ? "No speech detected" : transcript_;
    events_.send(SessionEvent::with_text(SessionEvent::Kind::Result, std::move(result)));
    events_.send(SessionEvent::ended());
}

void StreamingSession::run(std::stop_token st) {
    std::stop_callback on_stop(st, [this] { cancel(); });

    if (!start()) {
        auto until = Clock::now() + kErrorLinger;
        while (!cancelled() && Clock::now() < until) std::this_thread::sleep_for(100ms);
        events_.send(SessionEvent::ended());
        return;
    }

    std::jthread level_reporter([this](std::stop_token lst) {
        while (!lst.stop_requested()) {
            if (state() == SessionState::Listening) {
                events_.send(SessionEvent::level_reading(capture_.level()));
            }
            std::this_thread::sleep_for(kLevelInterval);
        }
    });

    const auto tick_period = std::chrono::milliseconds(config_.session.tick_ms);
    do {
        std::this_thread::sleep_for(tick_period);
    } while (tick(Clock::now()));

    level_reporter.request_stop();
    level_reporter.join();

    if (cancelled()) log("session cancelled");
    finish();
}

void StreamingSession::set_state(SessionState s) {
    state_.store(s, std::memory_order_release);
    events_.send(SessionEvent::state_change(s));
}

void StreamingSession::fail(const std::string& message) {
    std::println(stderr, "session: {}", message);
    state_.store(SessionState::Error, std::memory_order_release);
    events_.send(SessionEvent::with_text(SessionEvent::Kind::Error, message));
}

void StreamingSession::poll_accurate_model() {
    if (accurate_ || !accurate_future_.valid()) return;
    if (accurate_future_.wait_for(0s) != std::future_status::ready) return;

    auto res = accurate_future_.get();
    if (res) {
        accurate_.emplace(*res, config_.model.language, verbose_);
        log("accurate model ready: " + (*res)->name());
    } else {
        std::println(stderr, "session: accurate model failed to load ({}), using fast model for finals",
                     res.error());
    }
}

void StreamingSession::finalize_segment(Clock::time_point now) {
    set_state(SessionState::Transcribing);

    if (!accurate_ && accurate_future_.valid()) {
        log("accurate model not ready, waiting briefly");
        auto grace = std::chrono::duration<float>(config_.session.model_grace_s);
        if (accurate_future_.wait_for(grace) == std::future_status::ready) {
            poll_accurate_model();
        }
    }

    auto pcm = to_model_rate(capture_.take());

    std::expected<std::string, std::string> result;
    if (accurate_) {
        log("final decode: accurate model (beam search)");
        result = accurate_->transcribe_accurate(pcm);
    } else {
        log("final decode: fast model (greedy fallback)");
        result = fast_->transcribe_fast(pcm);
    }

    if (!result) {
        std::println(stderr, "session: segment skipped: {}", result.error());
    } else {
        auto text = trimmed(std::move(*result));
        if (!text.empty() && !is_hallucination(text)) {
            events_.send(SessionEvent::with_text(SessionEvent::Kind::Deliver, text));
            if (!transcript_.empty()) transcript_ += ' ';
            transcript_ += text;
            events_.send(SessionEvent::with_text(SessionEvent::Kind::Partial, transcript_));
        } else if (!text.empty()) {
            log("discarded hallucination: " + text);
        }
    }

    vad_ = {};
    new_speech_ = false;
    last_decode_ = now;
}

void StreamingSession::partial_decode(Clock::time_point now) {
    auto pcm = to_model_rate(capture_.snapshot());
    auto result = fast_->transcribe_fast(pcm);
    last_decode_ = now;

    if (!result) {
        std::println(stderr, "session: partial decode failed: {}", result.error());
        return;
    }

    auto text = trimmed(std::move(*result));
    if (text.empty() || is_hallucination(text)) return;

    std::string display = transcript_;
    if (!display.empty()) display += ' ';
    display += text;
    events_.send(SessionEvent::with_text(SessionEvent::Kind::Partial, std::move(display)));
}

std::vector<float> StreamingSession::to_model_rate(std::span<const float> pcm) const {
    return resample::convert(pcm, config_.audio.capture_rate, config_.audio.model_rate);
}

void StreamingSession::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[kiri] {}", msg);
    }
}

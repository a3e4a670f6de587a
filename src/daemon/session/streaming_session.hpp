#pragma once

#include "audio/audio_capture.hpp"
#include "audio/vad.hpp"
#include "config.hpp"
#include "event_channel.hpp"
#include "session/session_event.hpp"
#include "whisper/backend.hpp"
#include "whisper/transcription_engine.hpp"

#include <atomic>
#include <expected>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

// One dictation turn: continuous capture, dual-model scheduling, segment
// cutting and transcript accumulation. Events go to the channel in order.
//
// run() drives the whole turn. start()/tick()/finish() are the same steps
// exposed individually so a caller can supply its own clock.
class StreamingSession {
public:
    using Clock = vad::Clock;
    using ModelPtr = std::shared_ptr<const SpeechModel>;
    using ModelLoader = std::function<std::expected<ModelPtr, std::string>(const std::string& path)>;

    StreamingSession(Config config, AudioCapture& capture, ModelLoader loader,
                     EventChannel<SessionEvent>& events, bool verbose = false);
    ~StreamingSession();

    StreamingSession(const StreamingSession&) = delete;
    StreamingSession& operator=(const StreamingSession&) = delete;

    // Loads models and opens the input stream. On failure an Error event has
    // already been emitted and the session is in the Error state.
    std::expected<void, std::string> start(Clock::time_point now = Clock::now());

    // One poll of the orchestration loop. Returns false once the turn is over.
    bool tick(Clock::time_point now);

    // Emits Result (or "No speech detected") followed by Ended.
    void finish();

    void run(std::stop_token st);

    // Cooperative; observed at the next tick.
    void cancel() { cancelled_.store(true, std::memory_order_release); }
    bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

    SessionState state() const { return state_.load(std::memory_order_acquire); }
    const std::string& transcript() const { return transcript_; }
    bool accurate_ready() const { return accurate_.has_value(); }

private:
    void set_state(SessionState s);
    void fail(const std::string& message);
    void poll_accurate_model();
    void finalize_segment(Clock::time_point now);
    void partial_decode(Clock::time_point now);
    std::vector<float> to_model_rate(std::span<const float> pcm) const;
    void log(const std::string& msg);

    Config config_;
    AudioCapture& capture_;
    ModelLoader loader_;
    EventChannel<SessionEvent>& events_;
    bool verbose_;

    std::atomic<SessionState> state_{SessionState::Loading};
    std::atomic<bool> cancelled_{false};

    std::optional<TranscriptionEngine> fast_;
    std::optional<TranscriptionEngine> accurate_;
    std::future<std::expected<ModelPtr, std::string>> accurate_future_;

    AudioCapture::Stream stream_;

    // Per-segment speech/silence timers; reset after every finalized segment.
    vad::State vad_;
    bool had_speech_ = false;
    bool new_speech_ = false;
    std::optional<Clock::time_point> last_speech_;
    Clock::time_point last_decode_{};

    std::string transcript_;
};

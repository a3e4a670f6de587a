#pragma once

#include "audio/sample_buffer.hpp"
#include "audio/vad.hpp"
#include "platform/audio_device.hpp"

#include <atomic>
#include <cstdint>
#include <expected>
#include <mutex>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

struct CaptureParams {
    uint32_t sample_rate = 48000;
    uint32_t channels = 1;
    vad::Params vad;
    float max_duration_s = 120.0f;
};

// Owns the sample buffer, level meter and stop signal for one input stream.
// One recording operation at a time.
class AudioCapture {
public:
    // Keeps a continuous stream open; closing happens on destruction.
    class Stream {
    public:
        Stream() = default;
        explicit Stream(AudioCapture* owner) : owner_(owner) {}
        ~Stream() { release(); }

        Stream(Stream&& other) noexcept : owner_(std::exchange(other.owner_, nullptr)) {}
        Stream& operator=(Stream&& other) noexcept {
            if (this != &other) {
                release();
                owner_ = std::exchange(other.owner_, nullptr);
            }
            return *this;
        }

        Stream(const Stream&) = delete;
        Stream& operator=(const Stream&) = delete;

        bool active() const { return owner_ != nullptr; }
        void release();

    private:
        AudioCapture* owner_ = nullptr;
    };

    static constexpr float kDefaultSilence = 2.5f;

    AudioCapture(AudioDevice& device, CaptureParams params);
    ~AudioCapture();

    AudioCapture(const AudioCapture&) = delete;
    AudioCapture& operator=(const AudioCapture&) = delete;

    void reset();

    // Blocks until `silence_s` of silence follows confirmed speech, stop()
    // is called, `st` is stopped, or max_duration_s elapses. Returns
    // everything captured.
    std::expected<std::vector<float>, std::string> record_until_silence(float silence_s = kDefaultSilence,
                                                                        std::stop_token st = {});

    std::expected<Stream, std::string> start_continuous();

    std::vector<float> snapshot() const { return buffer_.snapshot(); }
    std::vector<float> take() { return buffer_.take(); }
    void clear_buffer() { buffer_.clear(); }
    size_t buffered_samples() const { return buffer_.size(); }
    float level() const { return level_.load(std::memory_order_relaxed); }

    void stop() { stop_.store(true, std::memory_order_release); }
    bool stopped() const { return stop_.load(std::memory_order_acquire); }

    // Last mid-stream error reported by the device, empty if none.
    std::string last_error() const;

    const CaptureParams& params() const { return params_; }

private:
    std::expected<void, std::string> open_stream(bool silence_policy, float silence_s);
    void close_stream();
    void on_frames(std::span<const float> frames);
    void on_error(const std::string& msg);

    AudioDevice& device_;
    CaptureParams params_;

    SampleBuffer buffer_;
    std::atomic<float> level_{0.0f};
    std::atomic<bool> stop_{false};

    // Touched only from the device callback while a stream is open.
    bool silence_policy_ = false;
    float silence_s_ = 0.0f;
    vad::State vad_state_;

    mutable std::mutex error_mutex_;
    std::string last_error_;
};

#include "audio/audio_capture.hpp"

#include <chrono>
#include <print>
#include <thread>

void AudioCapture::Stream::release() {
    if (owner_) {
        owner_->close_stream();
        owner_ = nullptr;
    }
}

AudioCapture::AudioCapture(AudioDevice& device, CaptureParams params)
    : device_(device), params_(std::move(params)) {}

AudioCapture::~AudioCapture() {
    close_stream();
}

void AudioCapture::reset() {
    stop_.store(false, std::memory_order_release);
    buffer_.clear();
    std::lock_guard lock(error_mutex_);
    last_error_.clear();
}

std::expected<std::vector<float>, std::string> AudioCapture::record_until_silence(float silence_s,
                                                                                   std::stop_token st) {
    reset();

    if (auto res = open_stream(true, silence_s); !res) {
        return std::unexpected(res.error());
    }

    auto start = std::chrono::steady_clock::now();
    while (!stopped() && !st.stop_requested()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        auto elapsed = std::chrono::duration<float>(std::chrono::steady_clock::now() - start);
        if (elapsed.count() >= params_.max_duration_s) break;
    }

    close_stream();

    if (auto err = last_error(); !err.empty()) {
        return std::unexpected("audio: " + err);
    }
    return buffer_.snapshot();
}

std::expected<AudioCapture::Stream, std::string> AudioCapture::start_continuous() {
    reset();

    if (auto res = open_stream(false, 0.0f); !res) {
        return std::unexpected(res.error());
    }
    return Stream(this);
}

std::string AudioCapture::last_error() const {
    std::lock_guard lock(error_mutex_);
    return last_error_;
}

std::expected<void, std::string> AudioCapture::open_stream(bool silence_policy, float silence_s) {
    if (device_.is_open()) {
        return std::unexpected("audio: a recording is already active on this device");
    }

    silence_policy_ = silence_policy;
    silence_s_ = silence_s;
    vad_state_ = {};
    level_.store(0.0f, std::memory_order_relaxed);

    StreamParams sp{
        .sample_rate = params_.sample_rate,
        .channels = params_.channels,
        .buffer_frames = 0,
    };
    return device_.open(
        sp,
        [this](std::span<const float> frames) { on_frames(frames); },
        [this](const std::string& msg) { on_error(msg); });
}

void AudioCapture::close_stream() {
    device_.close();
}

void AudioCapture::on_frames(std::span<const float> frames) {
    if (params_.channels > 1) {
        // Downmix interleaved frames to mono
        std::vector<float> mono(frames.size() / params_.channels);
        for (size_t i = 0; i < mono.size(); ++i) {
            float sum = 0.0f;
            for (uint32_t c = 0; c < params_.channels; ++c) sum += frames[i * params_.channels + c];
            mono[i] = sum / static_cast<float>(params_.channels);
        }
        buffer_.append(mono);
        level_.store(vad::rms(mono), std::memory_order_relaxed);
    } else {
        buffer_.append(frames);
        level_.store(vad::rms(frames), std::memory_order_relaxed);
    }

    if (!silence_policy_) return;

    double silence = vad::step(vad_state_, level(), vad::Clock::now(), params_.vad);
    if (vad_state_.silence_start && silence >= silence_s_) {
        stop_.store(true, std::memory_order_release);
    }
}

void AudioCapture::on_error(const std::string& msg) {
    std::println(stderr, "audio: stream error: {}", msg);
    {
        std::lock_guard lock(error_mutex_);
        last_error_ = msg;
    }
    stop_.store(true, std::memory_order_release);
}

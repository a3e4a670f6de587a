#pragma once

#include "platform/audio_device.hpp"

#include <atomic>
#include <cstdint>
#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>
#include <string>

class PipeWireDevice : public AudioDevice {
public:
    explicit PipeWireDevice(std::string node_name = "kiri");
    ~PipeWireDevice() override;

    PipeWireDevice(const PipeWireDevice&) = delete;
    PipeWireDevice& operator=(const PipeWireDevice&) = delete;

    std::expected<void, std::string> open(const StreamParams& params,
                                          FrameCallback on_frames,
                                          ErrorCallback on_error) override;
    void close() override;
    bool is_open() const override { return open_.load(std::memory_order_relaxed); }

private:
    static void on_process(void* userdata);
    static void on_state_changed(void* userdata, enum pw_stream_state old,
                                 enum pw_stream_state state, const char* error);

    void teardown();

    std::string node_name_;
    StreamParams params_;
    FrameCallback on_frames_;
    ErrorCallback on_error_;

    std::atomic<bool> open_{false};
    // Set once the stream reported an error; no frames are delivered afterwards.
    std::atomic<bool> failed_{false};

    pw_thread_loop* loop_ = nullptr;
    pw_stream* stream_ = nullptr;

    static constexpr pw_stream_events stream_events_ = {
        .version = PW_VERSION_STREAM_EVENTS,
        .state_changed = on_state_changed,
        .process = on_process,
    };
};

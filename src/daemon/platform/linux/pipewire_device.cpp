#include "platform/linux/pipewire_device.hpp"

#include <exception>
#include <format>
#include <print>
#include <spa/param/audio/format-utils.h>
#include <spa/utils/result.h>

PipeWireDevice::PipeWireDevice(std::string node_name)
    : node_name_(std::move(node_name)) {
    pw_init(nullptr, nullptr);
}

PipeWireDevice::~PipeWireDevice() {
    close();
    pw_deinit();
}

std::expected<void, std::string> PipeWireDevice::open(const StreamParams& params,
                                                      FrameCallback on_frames,
                                                      ErrorCallback on_error) {
    if (open_.load(std::memory_order_relaxed)) {
        return std::unexpected("audio: stream already open");
    }

    params_ = params;
    on_frames_ = std::move(on_frames);
    on_error_ = std::move(on_error);
    failed_.store(false, std::memory_order_relaxed);

    loop_ = pw_thread_loop_new(node_name_.c_str(), nullptr);
    if (!loop_) {
        return std::unexpected("audio: failed to create thread loop");
    }

    auto* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Capture",
        PW_KEY_MEDIA_ROLE, "Communication",
        PW_KEY_NODE_NAME, node_name_.c_str(),
        PW_KEY_APP_NAME, "kiri",
        nullptr
    );
    if (params_.buffer_frames > 0) {
        pw_properties_setf(props, PW_KEY_NODE_LATENCY, "%u/%u",
                           params_.buffer_frames, params_.sample_rate);
    }

    stream_ = pw_stream_new_simple(
        pw_thread_loop_get_loop(loop_),
        "kiri-capture",
        props,
        &stream_events_,
        this
    );

    if (!stream_) {
        teardown();
        return std::unexpected("audio: failed to create stream");
    }

    // F32 interleaved at the requested rate and channel count
    uint8_t buf[1024];
    spa_pod_builder b = SPA_POD_BUILDER_INIT(buf, sizeof(buf));
    auto info = SPA_AUDIO_INFO_RAW_INIT(
        .format = SPA_AUDIO_FORMAT_F32,
        .rate = params_.sample_rate,
        .channels = params_.channels
    );
    const spa_pod* pod_params[1];
    pod_params[0] = spa_format_audio_raw_build(&b, SPA_PARAM_EnumFormat, &info);

    int ret = pw_stream_connect(
        stream_,
        PW_DIRECTION_INPUT,
        PW_ID_ANY,
        static_cast<pw_stream_flags>(
            PW_STREAM_FLAG_AUTOCONNECT | PW_STREAM_FLAG_MAP_BUFFERS | PW_STREAM_FLAG_RT_PROCESS
        ),
        pod_params, 1
    );

    if (ret < 0) {
        teardown();
        return std::unexpected(std::format("audio: stream connect failed: {}", spa_strerror(ret)));
    }

    ret = pw_thread_loop_start(loop_);
    if (ret < 0) {
        teardown();
        return std::unexpected(std::format("audio: thread loop start failed: {}", spa_strerror(ret)));
    }

    open_.store(true, std::memory_order_release);
    return {};
}

void PipeWireDevice::close() {
    if (!open_.load(std::memory_order_relaxed)) return;

    open_.store(false, std::memory_order_release);
    teardown();
}

void PipeWireDevice::teardown() {
    if (loop_) {
        pw_thread_loop_stop(loop_);
    }
    if (stream_) {
        pw_stream_destroy(stream_);
        stream_ = nullptr;
    }
    if (loop_) {
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
}

void PipeWireDevice::on_process(void* userdata) {
    auto* self = static_cast<PipeWireDevice*>(userdata);

    auto* buf = pw_stream_dequeue_buffer(self->stream_);
    if (!buf) return;

    auto* d = &buf->buffer->datas[0];
    if (!d->data || self->failed_.load(std::memory_order_relaxed)) {
        pw_stream_queue_buffer(self->stream_, buf);
        return;
    }

    auto* data = reinterpret_cast<const float*>(
        static_cast<const uint8_t*>(d->data) + d->chunk->offset);
    size_t count = d->chunk->size / sizeof(float);

    if (self->open_.load(std::memory_order_relaxed) && count > 0) {
        try {
            self->on_frames_(std::span<const float>(data, count));
        } catch (const std::exception& e) {
            // Never unwind into PipeWire; stop producing frames instead.
            self->failed_.store(true, std::memory_order_relaxed);
            if (self->on_error_) self->on_error_(std::format("frame callback failed: {}", e.what()));
        }
    }

    pw_stream_queue_buffer(self->stream_, buf);
}

void PipeWireDevice::on_state_changed(void* userdata, enum pw_stream_state old,
                                      enum pw_stream_state state, const char* error) {
    auto* self = static_cast<PipeWireDevice*>(userdata);
    if (state != PW_STREAM_STATE_ERROR) return;

    std::string msg = std::format("stream state {} -> {}: {}",
                                  pw_stream_state_as_string(old),
                                  pw_stream_state_as_string(state),
                                  error ? error : "unknown error");
    std::println(stderr, "audio: {}", msg);
    self->failed_.store(true, std::memory_order_relaxed);
    if (self->on_error_) self->on_error_(msg);
}

#pragma once

#include <cstdint>
#include <expected>
#include <functional>
#include <span>
#include <string>

struct StreamParams {
    uint32_t sample_rate = 48000;
    uint32_t channels = 1;
    uint32_t buffer_frames = 0; // 0 = let the audio server decide
};

// Input stream on the default capture device.
// on_frames receives one hardware buffer of interleaved floats and must not block.
class AudioDevice {
public:
    using FrameCallback = std::function<void(std::span<const float>)>;
    using ErrorCallback = std::function<void(const std::string&)>;

    virtual ~AudioDevice() = default;
    virtual std::expected<void, std::string> open(const StreamParams& params,
                                                  FrameCallback on_frames,
                                                  ErrorCallback on_error) = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;
};

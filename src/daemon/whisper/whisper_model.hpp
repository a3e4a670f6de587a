#pragma once

#include "backend.hpp"

#include <expected>
#include <memory>
#include <string>

struct whisper_context;

// whisper.cpp GGML model. The context is shared; each decode creates its
// own whisper_state.
class WhisperModel : public SpeechModel {
public:
    static std::expected<std::unique_ptr<WhisperModel>, std::string>
        load(const std::string& path, int threads = 4);

    ~WhisperModel() override;

    WhisperModel(const WhisperModel&) = delete;
    WhisperModel& operator=(const WhisperModel&) = delete;

    std::expected<std::string, std::string>
        decode(std::span<const float> pcm_16k, const DecodeOptions& opts) const override;

    std::string name() const override { return path_; }

private:
    WhisperModel(whisper_context* ctx, std::string path, int threads);

    whisper_context* ctx_;
    std::string path_;
    int threads_;
};

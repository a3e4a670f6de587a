#pragma once

#include "whisper/backend.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <vector>

struct TranscriptionRequest {
    std::vector<float> samples; // 16 kHz mono
    std::string language = "en";
    DecodeStrategy strategy = DecodeStrategy::Fast;
    std::string prompt;
};

struct TranscriptResult {
    std::string text;
    double duration_s = 0.0;   // audio length before trimming
    double processing_s = 0.0;
};

// Preprocesses audio and decodes it with a loaded SpeechModel.
// Copies share the model; concurrent transcribe() calls are allowed.
class TranscriptionEngine {
public:
    static constexpr uint32_t kSampleRate = 16000;

    TranscriptionEngine(std::shared_ptr<const SpeechModel> model, std::string language,
                        bool verbose = false);

    std::expected<TranscriptResult, std::string> transcribe(const TranscriptionRequest& req) const;

    std::expected<std::string, std::string> transcribe_fast(std::span<const float> pcm_16k) const;
    std::expected<std::string, std::string> transcribe_accurate(std::span<const float> pcm_16k) const;
    std::expected<std::string, std::string> transcribe_with_prompt(std::span<const float> pcm_16k,
                                                                   const std::string& prompt) const;

    const SpeechModel& model() const { return *model_; }
    const std::string& language() const { return language_; }

private:
    std::expected<std::string, std::string> run(std::span<const float> pcm_16k,
                                                DecodeStrategy strategy,
                                                const std::string& prompt) const;

    std::shared_ptr<const SpeechModel> model_;
    std::string language_;
    bool verbose_;
};

#pragma once

#include <expected>
#include <span>
#include <string>

enum class DecodeStrategy {
    Fast,     // greedy, lowest latency
    Accurate, // beam search
    Prompted, // greedy seeded with a phrase vocabulary
};

struct DecodeOptions {
    std::string language = "en";
    DecodeStrategy strategy = DecodeStrategy::Fast;
    std::string prompt;
};

// A loaded speech-to-text model. decode() is safe to call from several
// threads at once; every call owns its decoding state.
class SpeechModel {
public:
    virtual ~SpeechModel() = default;
    virtual std::expected<std::string, std::string>
        decode(std::span<const float> pcm_16k, const DecodeOptions& opts) const = 0;
    virtual std::string name() const = 0;
};

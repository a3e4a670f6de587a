#pragma once

#include "wakeword/matcher.hpp"
#include "whisper/transcription_engine.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Lowercases ASCII and keeps only letters, digits, non-ASCII characters
// and single spaces.
std::string normalize_text(std::string_view text);

// Number of code points in a UTF-8 string.
size_t utf8_length(std::string_view s);

// Edit distance over code points of two normalized UTF-8 strings.
size_t levenshtein(std::string_view a, std::string_view b);

// First phrase found in `text`, either as a substring or as a run of
// phrase-length words within `tolerance` normalized edit distance.
std::optional<std::string> find_phrase(std::string_view text,
                                       const std::vector<std::string>& phrases,
                                       float tolerance);

// Transcribes each window with a prompt listing the phrases, then matches
// the text fuzzily.
class LexicalMatcher : public WakeMatcher {
public:
    struct Params {
        uint32_t capture_rate = 48000;
        uint32_t model_rate = 16000;
        float min_audio_s = 0.8f;
        float level_gate = 0.02f;
        float tolerance = 0.35f;
        float stride_s = 1.5f;
    };

    LexicalMatcher(TranscriptionEngine engine, std::vector<std::string> phrases, Params params);

    std::optional<WakeDetection> process(std::span<const float> samples) override;
    void reset() override {}
    float stride_s() const override { return params_.stride_s; }

    const std::string& prompt() const { return prompt_; }

private:
    TranscriptionEngine engine_;
    std::vector<std::string> phrases_;
    std::string prompt_;
    Params params_;
};

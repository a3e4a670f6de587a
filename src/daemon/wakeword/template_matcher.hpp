#pragma once

#include "wakeword/features.hpp"
#include "wakeword/matcher.hpp"
#include "wakeword/wakeword_model.hpp"

#include <deque>
#include <vector>

// Streams audio through the MFCC front end and aligns the most recent
// frames against every trained template with DTW.
class TemplateMatcher : public WakeMatcher {
public:
    struct Params {
        uint32_t sample_rate = 48000;
        uint32_t min_hits = 2;        // consecutive evaluations above threshold
        float level_gate = 0.02f;     // windows quieter than this are not scored
        float stride_s = 0.25f;
        size_t eval_every = 3;        // frames between evaluations
    };

    struct Candidate {
        std::string name;
        float score = 0.0f;
        float avg_score = 0.0f;
        uint32_t hits = 0;
        float score_sum = 0.0f;
    };

    TemplateMatcher(std::vector<WakeWordModel> models, Params params);

    std::optional<WakeDetection> process(std::span<const float> samples) override;
    void reset() override;
    float stride_s() const override { return params_.stride_s; }

    const std::vector<Candidate>& candidates() const { return candidates_; }

private:
    std::optional<WakeDetection> evaluate();
    float score_templates(const std::vector<features::Matrix>& normalized) const;

    std::vector<WakeWordModel> models_;
    std::vector<std::vector<features::Matrix>> normalized_; // mean-normalized templates per model
    Params params_;
    features::MfccExtractor extractor_;

    std::vector<Candidate> candidates_;
    std::deque<features::Frame> history_;
    std::deque<float> history_rms_;
    size_t max_frames_ = 0;
    size_t since_eval_ = 0;
};

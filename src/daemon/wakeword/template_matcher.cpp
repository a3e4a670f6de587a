#include "wakeword/template_matcher.hpp"

#include "wakeword/dtw.hpp"

#include <algorithm>

TemplateMatcher::TemplateMatcher(std::vector<WakeWordModel> models, Params params)
    : models_(std::move(models)), params_(params), extractor_(params.sample_rate) {
    for (const auto& m : models_) {
        auto& norm = normalized_.emplace_back();
        for (auto t : m.templates) {
            if (t.empty()) continue;
            max_frames_ = std::max(max_frames_, t.size());
            features::mean_normalize(t);
            norm.push_back(std::move(t));
        }
        candidates_.push_back({.name = m.name});
    }
    if (params_.eval_every == 0) params_.eval_every = 1;
}

void TemplateMatcher::reset() {
    extractor_.reset();
    history_.clear();
    history_rms_.clear();
    since_eval_ = 0;
    for (auto& c : candidates_) c = {.name = c.name};
}

std::optional<WakeDetection> TemplateMatcher::process(std::span<const float> samples) {
    if (models_.empty() || max_frames_ == 0) return std::nullopt;

    std::vector<float> rms;
    auto frames = extractor_.push(samples, &rms);

    for (size_t i = 0; i < frames.size(); ++i) {
        history_.push_back(std::move(frames[i]));
        history_rms_.push_back(rms[i]);
        if (history_.size() > max_frames_) {
            history_.pop_front();
            history_rms_.pop_front();
        }

        if (++since_eval_ < params_.eval_every) continue;
        since_eval_ = 0;

        if (auto det = evaluate()) {
            reset();
            return det;
        }
    }
    return std::nullopt;
}

float TemplateMatcher::score_templates(const std::vector<features::Matrix>& normalized) const {
    float best = 0.0f;
    for (const auto& tmpl : normalized) {
        if (tmpl.empty() || history_.size() < tmpl.size()) continue;

        size_t first = history_.size() - tmpl.size();
        float loudest = *std::max_element(history_rms_.begin() + static_cast<std::ptrdiff_t>(first),
                                          history_rms_.end());
        if (loudest < params_.level_gate) continue;

        features::Matrix window(history_.begin() + static_cast<std::ptrdiff_t>(first), history_.end());
        features::mean_normalize(window);
        float d = dtw::distance(window, tmpl);
        best = std::max(best, std::max(0.0f, 1.0f - d));
    }
    return best;
}

std::optional<WakeDetection> TemplateMatcher::evaluate() {
    std::optional<WakeDetection> found;

    for (size_t i = 0; i < models_.size(); ++i) {
        auto& c = candidates_[i];
        const auto& model = models_[i];

        c.score = score_templates(normalized_[i]);
        if (c.score >= model.threshold) {
            ++c.hits;
            c.score_sum += c.score;
            c.avg_score = c.score_sum / static_cast<float>(c.hits);
        } else {
            c.hits = 0;
            c.score_sum = 0.0f;
            c.avg_score = 0.0f;
        }

        if (c.hits >= params_.min_hits && c.avg_score >= model.threshold &&
            (!found || c.avg_score > found->avg_score)) {
            found = WakeDetection{.name = c.name, .score = c.score, .avg_score = c.avg_score, .hits = c.hits};
        }
    }
    return found;
}

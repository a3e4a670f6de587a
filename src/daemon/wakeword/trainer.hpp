#pragma once

#include <cstdint>
#include <expected>
#include <functional>
#include <span>
#include <stop_token>
#include <string>
#include <vector>

struct TrainerParams {
    std::string output_dir;           // wake-word directory
    uint32_t sample_rate = 48000;
    uint32_t samples = 5;             // prompted repetitions
    uint32_t min_accepted = 3;
    float min_sample_s = 0.3f;
    float padding_s = 0.1f;
    float trim_threshold = 0.01f;
    float threshold = 0.6f;           // detection threshold stored in the model
};

// Records labelled utterances and turns them into a template file.
class WakeWordTrainer {
public:
    // Returns one silence-terminated utterance.
    using Recorder = std::function<std::expected<std::vector<float>, std::string>()>;

    struct Callbacks {
        std::function<void(uint32_t index, uint32_t total)> on_prompt;
        // `note` is the saved file path, or the rejection reason
        std::function<void(uint32_t index, bool accepted, const std::string& note)> on_sample;
    };

    WakeWordTrainer(Recorder recorder, TrainerParams params, bool verbose = false);

    // Records up to params.samples utterances, keeps the usable ones as
    // <slug>_<n>.wav and writes <slug>.json. Returns the template path.
    std::expected<std::string, std::string> train(const std::string& phrase, const Callbacks& cb,
                                                  std::stop_token st = {});

    // Silence-trimmed copy of `raw`, or the reason it is unusable.
    std::expected<std::vector<float>, std::string> accept_sample(std::span<const float> raw) const;

    std::expected<std::string, std::string>
        build_from_samples(const std::string& phrase, const std::vector<std::vector<float>>& samples) const;

    // Rebuilds the template from <slug>_<n>.wav files already on disk.
    std::expected<std::string, std::string> build_from_files(const std::string& phrase) const;

    std::string template_path(const std::string& phrase) const;
    std::string sample_path(const std::string& phrase, uint32_t n) const;

private:
    Recorder recorder_;
    TrainerParams params_;
    bool verbose_;
};

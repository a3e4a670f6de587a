#include "wakeword/trainer.hpp"

#include "wav_file.hpp"
#include "wakeword/dtw.hpp"
#include "wakeword/wakeword_model.hpp"
#include "whisper/preprocess.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <print>
#include <regex>

namespace fs = std::filesystem;

namespace {

// <slug>_<n>.wav files in `dir`, ordered by n.
std::expected<std::vector<std::pair<int, fs::path>>, std::string>
recorded_samples(const std::string& dir, const std::string& slug) {
    std::regex pattern(slug + "_([0-9]+)\\.wav");

    std::vector<std::pair<int, fs::path>> files;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        std::smatch m;
        auto name = entry.path().filename().string();
        if (std::regex_match(name, m, pattern)) {
            files.emplace_back(std::stoi(m[1].str()), entry.path());
        }
    }
    if (ec) {
        return std::unexpected(std::format("training: cannot read {}: {}", dir, ec.message()));
    }
    std::ranges::sort(files);
    return files;
}

} // namespace

WakeWordTrainer::WakeWordTrainer(Recorder recorder, TrainerParams params, bool verbose)
    : recorder_(std::move(recorder)), params_(std::move(params)), verbose_(verbose) {}

std::string WakeWordTrainer::template_path(const std::string& phrase) const {
    return (fs::path(params_.output_dir) / (slugify(phrase) + ".json")).string();
}

std::string WakeWordTrainer::sample_path(const std::string& phrase, uint32_t n) const {
    return (fs::path(params_.output_dir) / std::format("{}_{}.wav", slugify(phrase), n)).string();
}

std::expected<std::vector<float>, std::string>
WakeWordTrainer::accept_sample(std::span<const float> raw) const {
    const auto rate = static_cast<float>(params_.sample_rate);
    auto min_len = static_cast<size_t>(params_.min_sample_s * rate);

    if (raw.size() < min_len) {
        return std::unexpected(std::format("too short ({:.2f}s)", raw.size() / rate));
    }

    auto speech = preprocess::trim_silence_padded(raw, params_.sample_rate,
                                                  params_.trim_threshold, params_.padding_s);
    if (speech.size() < min_len) {
        return std::unexpected(std::format("too little speech ({:.2f}s after trimming)", speech.size() / rate));
    }
    return std::vector<float>(speech.begin(), speech.end());
}

std::expected<std::string, std::string>
WakeWordTrainer::train(const std::string& phrase, const Callbacks& cb, std::stop_token st) {
    auto slug = slugify(phrase);
    if (slug.empty()) {
        return std::unexpected("training: phrase has no letters or digits");
    }

    std::error_code ec;
    fs::create_directories(params_.output_dir, ec);
    if (ec) {
        return std::unexpected(std::format("training: cannot create {}: {}", params_.output_dir, ec.message()));
    }

    // A new run replaces every take of the previous one
    auto previous = recorded_samples(params_.output_dir, slug);
    if (!previous) return std::unexpected(previous.error());
    for (const auto& file : *previous) {
        if (fs::remove(file.second, ec); ec) {
            std::println(stderr, "training: cannot remove {}: {}", file.second.string(), ec.message());
        }
    }

    std::vector<std::vector<float>> accepted;
    for (uint32_t i = 1; i <= params_.samples && !st.stop_requested(); ++i) {
        if (cb.on_prompt) cb.on_prompt(i, params_.samples);

        auto raw = recorder_();
        if (!raw) {
            std::println(stderr, "training: recording {} failed: {}", i, raw.error());
            if (cb.on_sample) cb.on_sample(i, false, raw.error());
            continue;
        }

        auto sample = accept_sample(*raw);
        if (!sample) {
            if (verbose_) std::println(stderr, "[kiri] sample {} discarded: {}", i, sample.error());
            if (cb.on_sample) cb.on_sample(i, false, sample.error());
            continue;
        }

        auto path = sample_path(phrase, static_cast<uint32_t>(accepted.size() + 1));
        if (auto res = wav::write_file(path, *sample, params_.sample_rate); !res) {
            std::println(stderr, "training: {}", res.error());
        }
        accepted.push_back(std::move(*sample));
        if (cb.on_sample) cb.on_sample(i, true, path);
    }

    if (st.stop_requested()) {
        return std::unexpected("training: cancelled");
    }
    return build_from_samples(phrase, accepted);
}

std::expected<std::string, std::string>
WakeWordTrainer::build_from_samples(const std::string& phrase,
                                    const std::vector<std::vector<float>>& samples) const {
    if (samples.size() < params_.min_accepted) {
        return std::unexpected(std::format("training: only {} usable samples, need at least {}",
                                           samples.size(), params_.min_accepted));
    }

    auto model = WakeWordModel::build(phrase, samples, params_.sample_rate, params_.threshold);
    if (!model) {
        return std::unexpected("training: " + model.error());
    }

    if (verbose_) {
        // Agreement between recordings; low values mean inconsistent takes
        const auto& t = model->templates;
        for (size_t i = 1; i < t.size(); ++i) {
            std::println(stderr, "[kiri] template {} vs 1: similarity {:.2f}", i + 1, dtw::similarity(t[i], t[0]));
        }
    }

    auto path = template_path(phrase);
    if (auto res = model->save(path); !res) {
        return std::unexpected("training: " + res.error());
    }
    return path;
}

std::expected<std::string, std::string> WakeWordTrainer::build_from_files(const std::string& phrase) const {
    auto files = recorded_samples(params_.output_dir, slugify(phrase));
    if (!files) return std::unexpected(files.error());

    std::vector<std::vector<float>> samples;
    for (const auto& [n, path] : *files) {
        auto audio = wav::read_file(path.string());
        if (!audio) {
            std::println(stderr, "training: {}: {}", path.string(), audio.error());
            continue;
        }
        if (audio->sample_rate != params_.sample_rate || audio->channels != 1) {
            std::println(stderr, "training: {} skipped ({} Hz / {} ch)", path.string(),
                         audio->sample_rate, audio->channels);
            continue;
        }
        samples.push_back(std::move(audio->samples));
    }
    return build_from_samples(phrase, samples);
}

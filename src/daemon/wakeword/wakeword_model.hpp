#pragma once

#include "wakeword/features.hpp"

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// Trained acoustic template for one wake phrase. Immutable once loaded;
// only usable with audio in the format it was built from.
struct WakeWordModel {
    std::string name;
    float threshold = 0.6f;
    uint32_t sample_rate = 48000;
    uint32_t channels = 1;
    size_t feature_width = features::kDefaultCoeffs;
    std::vector<features::Matrix> templates; // one per training utterance

    static std::expected<WakeWordModel, std::string>
        build(const std::string& name, const std::vector<std::vector<float>>& samples,
              uint32_t sample_rate, float threshold);

    std::expected<void, std::string> save(const std::string& path) const;

    // Fails when the file was built for another sample rate, channel count
    // or feature width.
    static std::expected<WakeWordModel, std::string>
        load(const std::string& path, uint32_t sample_rate, uint32_t channels);
};

// "Hey Kiri!" -> "hey_kiri"
std::string slugify(std::string_view phrase);

// Loads every *.json model in `dir`. Unreadable or mismatched files are
// logged and skipped.
std::vector<WakeWordModel> load_models(const std::string& dir, uint32_t sample_rate, uint32_t channels);

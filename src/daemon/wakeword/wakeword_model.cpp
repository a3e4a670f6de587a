#include "wakeword/wakeword_model.hpp"

#include <cctype>
#include <filesystem>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

std::expected<WakeWordModel, std::string>
WakeWordModel::build(const std::string& name, const std::vector<std::vector<float>>& samples,
                     uint32_t sample_rate, float threshold) {
    if (samples.empty()) {
        return std::unexpected("wakeword: no samples to build from");
    }

    features::MfccExtractor extractor(sample_rate);
    WakeWordModel model{
        .name = name,
        .threshold = threshold,
        .sample_rate = sample_rate,
        .channels = 1,
        .feature_width = extractor.n_coeffs(),
        .templates = {},
    };

    for (const auto& s : samples) {
        auto m = extractor.compute(s);
        if (m.empty()) continue;
        model.templates.push_back(std::move(m));
    }
    if (model.templates.empty()) {
        return std::unexpected("wakeword: samples too short for feature extraction");
    }
    return model;
}

std::expected<void, std::string> WakeWordModel::save(const std::string& path) const {
    json j = {
        {"name", name},
        {"threshold", threshold},
        {"sample_rate", sample_rate},
        {"channels", channels},
        {"feature_width", feature_width},
        {"templates", templates},
    };

    std::ofstream f(path);
    if (!f.is_open()) {
        return std::unexpected("wakeword: cannot write " + path);
    }
    f << j.dump() << '\n';
    if (!f) {
        return std::unexpected("wakeword: write failed for " + path);
    }
    return {};
}

std::expected<WakeWordModel, std::string>
WakeWordModel::load(const std::string& path, uint32_t sample_rate, uint32_t channels) {
    std::ifstream f(path);
    if (!f.is_open()) {
        return std::unexpected("wakeword: cannot open " + path);
    }

    WakeWordModel model;
    try {
        auto j = json::parse(f);
        model.name = j.at("name").get<std::string>();
        model.threshold = j.at("threshold").get<float>();
        model.sample_rate = j.at("sample_rate").get<uint32_t>();
        model.channels = j.at("channels").get<uint32_t>();
        model.feature_width = j.at("feature_width").get<size_t>();
        model.templates = j.at("templates").get<std::vector<features::Matrix>>();
    } catch (const json::exception& e) {
        return std::unexpected(std::format("wakeword: malformed {}: {}", path, e.what()));
    }

    if (model.sample_rate != sample_rate || model.channels != channels) {
        return std::unexpected(std::format(
            "wakeword: {} was built for {} Hz / {} ch, capture is {} Hz / {} ch",
            path, model.sample_rate, model.channels, sample_rate, channels));
    }
    if (model.feature_width != features::kDefaultCoeffs) {
        return std::unexpected(std::format("wakeword: {} has feature width {}, expected {}",
                                           path, model.feature_width, features::kDefaultCoeffs));
    }
    for (const auto& t : model.templates) {
        if (t.empty()) {
            return std::unexpected("wakeword: empty template in " + path);
        }
        for (const auto& frame : t) {
            if (frame.size() != model.feature_width) {
                return std::unexpected("wakeword: inconsistent template frame width in " + path);
            }
        }
    }
    if (model.templates.empty()) {
        return std::unexpected("wakeword: no templates in " + path);
    }
    return model;
}

std::string slugify(std::string_view phrase) {
    std::string out;
    bool pending_sep = false;
    for (unsigned char c : phrase) {
        // Non-ASCII bytes are kept so accented and non-Latin phrases survive
        if (std::isalnum(c) || c >= 0x80) {
            if (pending_sep && !out.empty()) out += '_';
            out += static_cast<char>(std::tolower(c));
            pending_sep = false;
        } else {
            pending_sep = true;
        }
    }
    return out;
}

std::vector<WakeWordModel> load_models(const std::string& dir, uint32_t sample_rate, uint32_t channels) {
    std::vector<WakeWordModel> models;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return models;

    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (entry.path().extension() != ".json") continue;
        auto m = WakeWordModel::load(entry.path().string(), sample_rate, channels);
        if (!m) {
            std::println(stderr, "{}", m.error());
            continue;
        }
        models.push_back(std::move(*m));
    }
    return models;
}

#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template <typename T>
void read_key(const json& obj, const char* key, T& out) {
    if (obj.contains(key)) out = obj[key].get<T>();
}

} // namespace

std::string Config::accurate_model_path() const {
    if (!model.accurate_path.empty()) return model.accurate_path;
    return (fs::path(platform::models_dir()) / "ggml-medium.bin").string();
}

std::string Config::fast_model_path() const {
    if (!model.fast_path.empty()) return model.fast_path;
    return (fs::path(platform::models_dir()) / "ggml-tiny.bin").string();
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("model")) {
            auto& m = j["model"];
            read_key(m, "accurate", cfg.model.accurate_path);
            read_key(m, "fast", cfg.model.fast_path);
            read_key(m, "language", cfg.model.language);
            read_key(m, "threads", cfg.model.threads);
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            read_key(a, "capture_rate", cfg.audio.capture_rate);
            read_key(a, "model_rate", cfg.audio.model_rate);
            read_key(a, "channels", cfg.audio.channels);
            read_key(a, "speech_threshold", cfg.audio.speech_threshold);
            read_key(a, "speech_min_seconds", cfg.audio.speech_min_s);
            read_key(a, "max_record_seconds", cfg.audio.max_record_s);
        }

        if (j.contains("session")) {
            auto& s = j["session"];
            read_key(s, "segment_silence_seconds", cfg.session.segment_silence_s);
            read_key(s, "done_timeout_seconds", cfg.session.done_timeout_s);
            read_key(s, "max_seconds", cfg.session.max_session_s);
            read_key(s, "min_segment_seconds", cfg.session.min_segment_s);
            read_key(s, "partial_interval_seconds", cfg.session.partial_interval_s);
            read_key(s, "model_grace_seconds", cfg.session.model_grace_s);
            read_key(s, "tick_ms", cfg.session.tick_ms);
        }

        if (j.contains("wake")) {
            auto& w = j["wake"];
            read_key(w, "enabled", cfg.wake.enabled);
            read_key(w, "matcher", cfg.wake.matcher);
            read_key(w, "phrases", cfg.wake.phrases);
            read_key(w, "cooldown_seconds", cfg.wake.cooldown_s);
            read_key(w, "stride_seconds", cfg.wake.stride_s);
            read_key(w, "min_audio_seconds", cfg.wake.min_audio_s);
            read_key(w, "vad_threshold", cfg.wake.vad_threshold);
            read_key(w, "match_tolerance", cfg.wake.match_tolerance);
            read_key(w, "template_threshold", cfg.wake.template_threshold);
            read_key(w, "min_hits", cfg.wake.min_hits);
            read_key(w, "training_samples", cfg.wake.training_samples);
            read_key(w, "training_silence_seconds", cfg.wake.training_silence_s);
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}

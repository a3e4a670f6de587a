#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct Config {
    struct Model {
        // Empty paths resolve against platform::models_dir().
        std::string accurate_path;
        std::string fast_path;
        std::string language = "en";
        int threads = 4;
    } model;

    struct Audio {
        uint32_t capture_rate = 48000;
        uint32_t model_rate = 16000;
        uint16_t channels = 1;
        float speech_threshold = 0.015f;
        float speech_min_s = 0.5f;
        float max_record_s = 120.0f;
    } audio;

    struct Session {
        float segment_silence_s = 1.0f;
        float done_timeout_s = 5.0f;
        float max_session_s = 120.0f;
        float min_segment_s = 0.5f;
        float partial_interval_s = 1.5f;
        float model_grace_s = 3.0f;
        uint32_t tick_ms = 100;
    } session;

    struct Wake {
        bool enabled = true;
        std::string matcher = "template"; // "template" or "lexical"
        std::vector<std::string> phrases = {"hey kiri", "kiri"};
        float cooldown_s = 5.0f;
        float stride_s = 1.5f;
        float min_audio_s = 0.8f;
        float vad_threshold = 0.02f;
        float match_tolerance = 0.35f;
        float template_threshold = 0.6f;
        uint32_t min_hits = 2;
        uint32_t training_samples = 5;
        float training_silence_s = 1.0f;
    } wake;

    std::string accurate_model_path() const;
    std::string fast_model_path() const;

    static Config load(const std::string& path);
    static Config load_default();
};

#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "kiri_test_config_XXXXXX";
        // mkstemp needs a mutable char*
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        std::ofstream(path) << content;
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.model.language == "en");
        REQUIRE(cfg.audio.capture_rate == 48000);
        REQUIRE(cfg.audio.model_rate == 16000);
        REQUIRE(cfg.audio.channels == 1);
        REQUIRE(cfg.audio.speech_threshold == 0.015f);
        REQUIRE(cfg.session.segment_silence_s == 1.0f);
        REQUIRE(cfg.session.done_timeout_s == 5.0f);
        REQUIRE(cfg.session.max_session_s == 120.0f);
        REQUIRE(cfg.wake.enabled);
        REQUIRE(cfg.wake.phrases == std::vector<std::string>{"hey kiri", "kiri"});
        REQUIRE(cfg.wake.cooldown_s == 5.0f);
        REQUIRE(cfg.wake.training_samples == 5);
    }

    SECTION("ModelPathsFallBackToModelsDir") {
        Config cfg;
        REQUIRE(cfg.fast_model_path().ends_with("ggml-tiny.bin"));
        REQUIRE(cfg.accurate_model_path().ends_with("ggml-medium.bin"));

        cfg.model.fast_path = "/opt/models/small.bin";
        REQUIRE(cfg.fast_model_path() == "/opt/models/small.bin");
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "model": { "fast": "/m/tiny.bin", "accurate": "/m/large.bin", "language": "de", "threads": 8 },
            "audio": { "capture_rate": 44100, "speech_threshold": 0.03, "max_record_seconds": 30 },
            "session": { "segment_silence_seconds": 0.8, "done_timeout_seconds": 3, "tick_ms": 50 },
            "wake": {
                "enabled": false,
                "matcher": "lexical",
                "phrases": ["computer"],
                "cooldown_seconds": 2,
                "min_hits": 3
            }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.fast_model_path() == "/m/tiny.bin");
        REQUIRE(cfg.accurate_model_path() == "/m/large.bin");
        REQUIRE(cfg.model.language == "de");
        REQUIRE(cfg.model.threads == 8);
        REQUIRE(cfg.audio.capture_rate == 44100);
        REQUIRE(cfg.audio.speech_threshold == 0.03f);
        REQUIRE(cfg.audio.max_record_s == 30.0f);
        REQUIRE(cfg.session.segment_silence_s == 0.8f);
        REQUIRE(cfg.session.done_timeout_s == 3.0f);
        REQUIRE(cfg.session.tick_ms == 50);
        REQUIRE_FALSE(cfg.wake.enabled);
        REQUIRE(cfg.wake.matcher == "lexical");
        REQUIRE(cfg.wake.phrases == std::vector<std::string>{"computer"});
        REQUIRE(cfg.wake.cooldown_s == 2.0f);
        REQUIRE(cfg.wake.min_hits == 3);
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "model": { "language": "fr" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.model.language == "fr");
        // Other fields retain defaults
        REQUIRE(cfg.audio.capture_rate == 48000);
        REQUIRE(cfg.wake.enabled);
        REQUIRE(cfg.session.done_timeout_s == 5.0f);
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        // Falls back to defaults
        REQUIRE(cfg.model.language == "en");
        REQUIRE(cfg.audio.capture_rate == 48000);
    }

    SECTION("WrongTypeFallsBackToDefaults") {
        TmpFile f(R"({ "wake": { "cooldown_seconds": "soon" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.wake.cooldown_s == 5.0f);
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/kiri_test_nonexistent_config_file.json");
        REQUIRE(cfg.model.language == "en");
        REQUIRE(cfg.audio.capture_rate == 48000);
    }
}

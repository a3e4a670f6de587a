#include <catch2/catch_test_macros.hpp>

#include "wakeword/trainer.hpp"
#include "wakeword/wakeword_model.hpp"

#include <cmath>
#include <deque>
#include <filesystem>
#include <stop_token>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr uint32_t kRate = 48000;

using Take = std::expected<std::vector<float>, std::string>;

// 0.1s silence, `speech_s` of tone, 0.1s silence
std::vector<float> utterance(float speech_s, float freq = 440.0f) {
    const size_t pad = kRate / 10;
    const auto len = static_cast<size_t>(speech_s * kRate);
    std::vector<float> out(pad * 2 + len, 0.0f);
    for (size_t i = 0; i < len; ++i) {
        out[pad + i] = 0.3f * std::sin(2.0f * 3.14159265f * freq * static_cast<float>(i) / kRate);
    }
    return out;
}

struct TmpDir {
    fs::path path = fs::temp_directory_path() / ("kiri_test_train_" + std::to_string(getpid()));
    TmpDir() { fs::remove_all(path); }
    ~TmpDir() { fs::remove_all(path); }
};

WakeWordTrainer::Recorder scripted(std::deque<Take>& takes) {
    return [&takes]() -> Take {
        if (takes.empty()) return std::unexpected("no more takes");
        Take t = std::move(takes.front());
        takes.pop_front();
        return t;
    };
}

} // namespace

TEST_CASE("Wake word trainer", "[wakeword]") {
    TmpDir dir;
    TrainerParams params{.output_dir = dir.path.string(), .sample_rate = kRate, .samples = 5};

    std::vector<uint32_t> prompts;
    std::vector<bool> verdicts;
    WakeWordTrainer::Callbacks cb{
        .on_prompt = [&prompts](uint32_t i, uint32_t) { prompts.push_back(i); },
        .on_sample = [&verdicts](uint32_t, bool accepted, const std::string&) { verdicts.push_back(accepted); },
    };

    SECTION("SampleAcceptance") {
        std::deque<Take> none;
        WakeWordTrainer trainer(scripted(none), params);

        REQUIRE(trainer.accept_sample(utterance(0.5f)).has_value());
        REQUIRE_FALSE(trainer.accept_sample(std::vector<float>(kRate / 10, 0.3f)).has_value());
        REQUIRE_FALSE(trainer.accept_sample(std::vector<float>(kRate, 0.0f)).has_value());
        // Long recording, but only a blip of sound in it
        auto blip = std::vector<float>(kRate, 0.0f);
        for (size_t i = 0; i < 960; ++i) blip[kRate / 2 + i] = 0.3f;
        REQUIRE_FALSE(trainer.accept_sample(blip).has_value());

        // Padding keeps 0.1s either side of the speech
        auto kept = trainer.accept_sample(utterance(0.5f));
        REQUIRE(kept->size() == utterance(0.5f).size());
    }

    SECTION("TooFewUsableSamples") {
        std::deque<Take> takes = {
            utterance(0.5f),
            std::vector<float>(kRate / 10, 0.3f),
            std::vector<float>(kRate, 0.0f),
            utterance(0.6f),
            std::unexpected("device unplugged"),
        };
        WakeWordTrainer trainer(scripted(takes), params);

        auto res = trainer.train("Hey Kiri", cb);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error() == "training: only 2 usable samples, need at least 3");
        REQUIRE(prompts == std::vector<uint32_t>{1, 2, 3, 4, 5});
        REQUIRE(verdicts == std::vector<bool>{true, false, false, true, false});
        REQUIRE_FALSE(fs::exists(dir.path / "hey_kiri.json"));
        REQUIRE(fs::exists(dir.path / "hey_kiri_1.wav"));
        REQUIRE(fs::exists(dir.path / "hey_kiri_2.wav"));
    }

    SECTION("WritesOneTemplate") {
        std::deque<Take> takes = {
            utterance(0.5f, 400.0f),
            utterance(0.55f, 420.0f),
            std::vector<float>(kRate, 0.0f),
            utterance(0.5f, 440.0f),
            utterance(0.6f, 410.0f),
        };
        WakeWordTrainer trainer(scripted(takes), params);

        auto res = trainer.train("Hey Kiri", cb);
        REQUIRE(res.has_value());
        REQUIRE(*res == (dir.path / "hey_kiri.json").string());

        size_t json_files = 0;
        for (const auto& e : fs::directory_iterator(dir.path)) json_files += e.path().extension() == ".json";
        REQUIRE(json_files == 1);

        auto model = WakeWordModel::load(*res, kRate, 1);
        REQUIRE(model.has_value());
        REQUIRE(model->name == "Hey Kiri");
        REQUIRE(model->templates.size() == 4);
        REQUIRE(model->threshold == params.threshold);

        SECTION("RebuildFromSavedRecordings") {
            fs::remove(*res);
            auto rebuilt = trainer.build_from_files("Hey Kiri");
            REQUIRE(rebuilt.has_value());
            auto again = WakeWordModel::load(*rebuilt, kRate, 1);
            REQUIRE(again.has_value());
            REQUIRE(again->templates.size() == 4);
        }
    }

    SECTION("RetrainReplacesOldTakes") {
        std::deque<Take> first = {
            utterance(0.5f, 400.0f), utterance(0.5f, 420.0f), utterance(0.5f, 440.0f),
            utterance(0.5f, 460.0f), utterance(0.5f, 480.0f),
        };
        REQUIRE(WakeWordTrainer(scripted(first), params).train("kiri", cb).has_value());
        REQUIRE(fs::exists(dir.path / "kiri_5.wav"));

        // A take from another phrase sharing the prefix must survive
        auto other = dir.path / "kiri_there_1.wav";
        fs::copy_file(dir.path / "kiri_1.wav", other);

        std::deque<Take> second = {utterance(0.5f, 500.0f), utterance(0.5f, 520.0f), utterance(0.5f, 540.0f)};
        params.samples = 3;
        WakeWordTrainer retrainer(scripted(second), params);
        auto res = retrainer.train("kiri", cb);
        REQUIRE(res.has_value());
        REQUIRE(fs::exists(dir.path / "kiri_3.wav"));
        REQUIRE_FALSE(fs::exists(dir.path / "kiri_4.wav"));
        REQUIRE_FALSE(fs::exists(dir.path / "kiri_5.wav"));
        REQUIRE(fs::exists(other));

        auto model = WakeWordModel::load(*res, kRate, 1);
        REQUIRE(model.has_value());
        REQUIRE(model->templates.size() == 3);

        fs::remove(*res);
        auto rebuilt = retrainer.build_from_files("kiri");
        REQUIRE(rebuilt.has_value());
        REQUIRE(WakeWordModel::load(*rebuilt, kRate, 1)->templates.size() == 3);
    }

    SECTION("NonAsciiPhrase") {
        std::deque<Take> takes = {utterance(0.5f, 400.0f), utterance(0.5f, 420.0f), utterance(0.5f, 440.0f)};
        params.samples = 3;
        auto res = WakeWordTrainer(scripted(takes), params).train("Hé Café", cb);
        REQUIRE(res.has_value());
        REQUIRE(*res == (dir.path / "hé_café.json").string());
        REQUIRE(fs::exists(dir.path / "hé_café_1.wav"));
    }

    SECTION("CancelStopsBetweenTakes") {
        std::stop_source stop;
        std::deque<Take> takes = {utterance(0.5f), utterance(0.5f), utterance(0.5f)};
        WakeWordTrainer trainer(
            [&]() -> Take {
                stop.request_stop();
                return scripted(takes)();
            },
            params);

        auto res = trainer.train("kiri", cb, stop.get_token());
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error() == "training: cancelled");
        REQUIRE(prompts.size() == 1);
        REQUIRE_FALSE(fs::exists(dir.path / "kiri.json"));
    }

    SECTION("PhraseNeedsLetters") {
        std::deque<Take> takes;
        WakeWordTrainer trainer(scripted(takes), params);
        REQUIRE_FALSE(trainer.train("?!", cb).has_value());
        REQUIRE(prompts.empty());
    }
}

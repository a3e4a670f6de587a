#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "whisper/transcription_engine.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <vector>

namespace {

std::vector<float> speech_like(size_t n, float amplitude) {
    std::vector<float> out(n);
    for (size_t i = 0; i < n; ++i) out[i] = amplitude * std::sin(0.07f * static_cast<float>(i));
    return out;
}

} // namespace

TEST_CASE("Transcription engine", "[whisper]") {
    auto model = std::make_shared<FakeSpeechModel>(std::vector<std::string>{"hello there"});
    TranscriptionEngine engine(model, "en");

    SECTION("SilenceSkipsTheModel") {
        std::vector<float> silence(16000, 0.0f);
        auto res = engine.transcribe({.samples = silence});
        REQUIRE(res.has_value());
        REQUIRE(res->text.empty());
        REQUIRE(res->duration_s == 1.0);
        REQUIRE(model->calls() == 0);

        auto fast = engine.transcribe_fast({});
        REQUIRE(fast.has_value());
        REQUIRE(fast->empty());
        REQUIRE(model->calls() == 0);
    }

    SECTION("DecodesTrimmedSpeech") {
        std::vector<float> audio(16000, 0.0f);
        auto voice = speech_like(8000, 0.2f);
        // Aligned to the 20ms trim windows
        std::copy(voice.begin(), voice.end(), audio.begin() + 4160);

        auto res = engine.transcribe({.samples = audio, .strategy = DecodeStrategy::Accurate});
        REQUIRE(res.has_value());
        REQUIRE(res->text == "hello there");
        REQUIRE(model->calls() == 1);
        REQUIRE(model->last_strategy() == DecodeStrategy::Accurate);
        // Leading and trailing silence never reach the model
        REQUIRE(model->last_len() == 8000);
    }

    SECTION("StrategyHelpers") {
        auto audio = speech_like(16000, 0.3f);

        REQUIRE(engine.transcribe_fast(audio).has_value());
        REQUIRE(model->last_strategy() == DecodeStrategy::Fast);

        REQUIRE(engine.transcribe_accurate(audio).has_value());
        REQUIRE(model->last_strategy() == DecodeStrategy::Accurate);

        REQUIRE(engine.transcribe_with_prompt(audio, "hey kiri. kiri.").has_value());
        REQUIRE(model->last_strategy() == DecodeStrategy::Prompted);
        REQUIRE(model->last_prompt() == "hey kiri. kiri.");
    }

    SECTION("ModelErrorsPropagate") {
        model->error = "out of memory";
        auto res = engine.transcribe_fast(speech_like(16000, 0.3f));
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error() == "decode: out of memory");
    }
}

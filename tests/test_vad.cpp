#include <catch2/catch_test_macros.hpp>

#include "audio/vad.hpp"

#include <chrono>
#include <vector>

using namespace std::chrono_literals;

TEST_CASE("RMS level", "[vad]") {

    SECTION("EmptyIsZero") {
        REQUIRE(vad::rms({}) == 0.0f);
    }

    SECTION("ConstantSignal") {
        std::vector<float> v(100, -0.5f);
        REQUIRE(vad::rms(v) == 0.5f);
    }
}

TEST_CASE("Speech/silence timers", "[vad]") {
    vad::Params params{.threshold = 0.015f, .min_speech_s = 0.5f};
    vad::State state;
    auto t0 = vad::Clock::now();

    SECTION("ShortBurstIsNotSpeech") {
        vad::step(state, 0.1f, t0, params);
        vad::step(state, 0.1f, t0 + 300ms, params);
        REQUIRE(vad::step(state, 0.0f, t0 + 400ms, params) == 0.0);
        REQUIRE_FALSE(state.speech_detected);

        // The dwell timer restarts after the gap
        vad::step(state, 0.1f, t0 + 500ms, params);
        vad::step(state, 0.1f, t0 + 900ms, params);
        REQUIRE_FALSE(state.speech_detected);
    }

    SECTION("SustainedLevelConfirmsSpeech") {
        vad::step(state, 0.1f, t0, params);
        vad::step(state, 0.1f, t0 + 500ms, params);
        REQUIRE(state.speech_detected);
    }

    SECTION("SilenceIsMeasuredFromFirstQuietFrame") {
        vad::step(state, 0.1f, t0, params);
        vad::step(state, 0.1f, t0 + 600ms, params);

        REQUIRE(vad::step(state, 0.0f, t0 + 700ms, params) == 0.0);
        REQUIRE(vad::step(state, 0.0f, t0 + 1200ms, params) == 0.5);
        REQUIRE(vad::step(state, 0.0f, t0 + 1700ms, params) == 1.0);
    }

    SECTION("SpeechResetsSilence") {
        vad::step(state, 0.1f, t0, params);
        vad::step(state, 0.1f, t0 + 600ms, params);
        vad::step(state, 0.0f, t0 + 700ms, params);
        vad::step(state, 0.0f, t0 + 1200ms, params);

        REQUIRE(vad::step(state, 0.1f, t0 + 1300ms, params) == 0.0);
        REQUIRE_FALSE(state.silence_start.has_value());
        REQUIRE(vad::step(state, 0.0f, t0 + 1400ms, params) == 0.0);
        REQUIRE(vad::step(state, 0.0f, t0 + 1600ms, params) > 0.19);
    }

    SECTION("ThresholdIsExclusive") {
        vad::step(state, 0.015f, t0, params);
        vad::step(state, 0.015f, t0 + 1s, params);
        REQUIRE_FALSE(state.speech_detected);
    }
}

#include <catch2/catch_test_macros.hpp>

#include "audio/audio_capture.hpp"
#include "fakes.hpp"

#include <chrono>
#include <stop_token>
#include <thread>

using namespace std::chrono_literals;

TEST_CASE("Audio capture", "[audio]") {
    FakeAudioDevice device;
    AudioCapture capture(device, CaptureParams{.sample_rate = 48000, .channels = 1, .max_duration_s = 5.0f});

    SECTION("ContinuousStreamBuffersFrames") {
        auto stream = capture.start_continuous();
        REQUIRE(stream.has_value());
        REQUIRE(device.is_open());
        REQUIRE(device.params().sample_rate == 48000);

        device.push(constant(480, 0.1f));
        device.push(constant(480, 0.1f));
        REQUIRE(capture.buffered_samples() == 960);
        REQUIRE(capture.level() > 0.09f);

        auto taken = capture.take();
        REQUIRE(taken.size() == 960);
        REQUIRE(capture.buffered_samples() == 0);

        stream->release();
        REQUIRE_FALSE(device.is_open());
    }

    SECTION("StreamClosesOnDestruction") {
        {
            auto stream = capture.start_continuous();
            REQUIRE(stream.has_value());
        }
        REQUIRE_FALSE(device.is_open());
    }

    SECTION("OneRecordingAtATime") {
        auto first = capture.start_continuous();
        REQUIRE(first.has_value());

        auto second = capture.start_continuous();
        REQUIRE_FALSE(second.has_value());
        REQUIRE(device.open_count.load() == 1);
    }

    SECTION("DeviceOpenFailure") {
        device.open_error = "no default source";
        auto stream = capture.start_continuous();
        REQUIRE_FALSE(stream.has_value());
        REQUIRE(stream.error() == "no default source");
    }

    SECTION("StereoIsDownmixed") {
        FakeAudioDevice stereo_dev;
        AudioCapture stereo(stereo_dev, CaptureParams{.sample_rate = 48000, .channels = 2});
        auto stream = stereo.start_continuous();
        REQUIRE(stream.has_value());

        stereo_dev.push({1.0f, 0.0f, 0.5f, 0.5f});
        auto mono = stereo.take();
        REQUIRE(mono == std::vector<float>{0.5f, 0.5f});
    }

    SECTION("RecordUntilStopped") {
        std::jthread feeder([&] {
            while (!device.is_open()) std::this_thread::sleep_for(1ms);
            device.push(constant(4800, 0.2f));
            capture.stop();
        });

        auto res = capture.record_until_silence();
        REQUIRE(res.has_value());
        REQUIRE(res->size() == 4800);
        REQUIRE_FALSE(device.is_open());
    }

    SECTION("RecordHonoursStopToken") {
        std::stop_source source;
        std::jthread feeder([&] {
            while (!device.is_open()) std::this_thread::sleep_for(1ms);
            source.request_stop();
        });

        auto res = capture.record_until_silence(1.0f, source.get_token());
        REQUIRE(res.has_value());
        REQUIRE(res->empty());
        REQUIRE_FALSE(device.is_open());
    }

    SECTION("RecordReportsDeviceErrors") {
        std::jthread feeder([&] {
            while (!device.is_open()) std::this_thread::sleep_for(1ms);
            device.fail("device unplugged");
        });

        auto res = capture.record_until_silence(1.0f);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error() == "audio: device unplugged");
    }

    SECTION("RecordEndsAfterSilenceFollowingSpeech") {
        std::jthread feeder([&] {
            while (!device.is_open()) std::this_thread::sleep_for(1ms);
            // 0.6s of speech then silence, paced in real time
            for (int i = 0; i < 6; ++i) {
                device.push(constant(4800, 0.2f));
                std::this_thread::sleep_for(100ms);
            }
            for (int i = 0; i < 20 && device.is_open(); ++i) {
                device.push(constant(4800, 0.0f));
                std::this_thread::sleep_for(100ms);
            }
        });

        auto t0 = std::chrono::steady_clock::now();
        auto res = capture.record_until_silence(0.3f);
        auto elapsed = std::chrono::steady_clock::now() - t0;

        REQUIRE(res.has_value());
        REQUIRE(elapsed < 3s);
        REQUIRE(res->size() >= 6 * 4800);
    }
}

#include <catch2/catch_test_macros.hpp>

#include "event_channel.hpp"
#include "session/session_event.hpp"

#include <atomic>
#include <thread>
#include <vector>

TEST_CASE("Event channel", "[events]") {

    SECTION("EmptyChannel") {
        EventChannel<int> ch;
        REQUIRE(ch.empty());
        REQUIRE_FALSE(ch.try_recv().has_value());
        REQUIRE(ch.drain().empty());
    }

    SECTION("PreservesOrder") {
        EventChannel<int> ch;
        for (int i = 0; i < 4; ++i) ch.send(i);

        REQUIRE(ch.try_recv() == 0);
        auto rest = ch.drain();
        REQUIRE(rest == std::vector<int>{1, 2, 3});
        REQUIRE(ch.empty());
    }

    SECTION("NotifyRunsOncePerSend") {
        int notified = 0;
        EventChannel<int> ch([&notified] { ++notified; });
        ch.send(1);
        ch.send(2);
        REQUIRE(notified == 2);
    }

    SECTION("ConcurrentProducers") {
        std::atomic<int> notified{0};
        EventChannel<int> ch([&notified] { notified.fetch_add(1); });
        {
            std::vector<std::jthread> producers;
            for (int t = 0; t < 4; ++t) {
                producers.emplace_back([&ch, t] {
                    for (int i = 0; i < 100; ++i) ch.send(t * 100 + i);
                });
            }
        }
        auto all = ch.drain();
        REQUIRE(all.size() == 400);
        REQUIRE(notified.load() == 400);
    }
}

TEST_CASE("Session event wire format", "[events]") {

    SECTION("StateEvent") {
        auto j = to_json(SessionEvent::state_change(SessionState::Transcribing));
        REQUIRE(j["event"] == "state");
        REQUIRE(j["state"] == "transcribing");
        REQUIRE_FALSE(j.contains("text"));
    }

    SECTION("TextEvents") {
        auto j = to_json(SessionEvent::with_text(SessionEvent::Kind::Deliver, "hello"));
        REQUIRE(j["event"] == "deliver");
        REQUIRE(j["text"] == "hello");

        j = to_json(SessionEvent::with_text(SessionEvent::Kind::Wake, "hey kiri"));
        REQUIRE(j["event"] == "wake");
        REQUIRE(j["text"] == "hey kiri");
    }

    SECTION("LevelEvent") {
        auto j = to_json(SessionEvent::level_reading(0.25f));
        REQUIRE(j["event"] == "level");
        REQUIRE(j["level"].get<float>() == 0.25f);
    }

    SECTION("EndedCarriesNothingElse") {
        auto j = to_json(SessionEvent::ended());
        REQUIRE(j.size() == 1);
        REQUIRE(j["event"] == "ended");
    }
}

#include <catch2/catch_test_macros.hpp>

#include "daemon_core.hpp"
#include "fakes.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <thread>
#include <unistd.h>

using namespace std::chrono_literals;
using json = nlohmann::json;

namespace {

constexpr int kClientFd = 7;
constexpr int kWatcherFd = 9;

Config quiet_config() {
    Config c;
    c.wake.enabled = false;
    c.session.tick_ms = 10;
    c.model.fast_path = "fast.bin";
    c.model.accurate_path = "accurate.bin";
    return c;
}

// Points XDG_DATA_HOME at a scratch directory so wake-word files stay out
// of the real home directory.
struct ScratchDataHome {
    std::filesystem::path path =
        std::filesystem::temp_directory_path() / ("kiri_test_data_" + std::to_string(getpid()));
    ScratchDataHome() {
        std::filesystem::remove_all(path);
        setenv("XDG_DATA_HOME", path.c_str(), 1);
    }
    ~ScratchDataHome() { std::filesystem::remove_all(path); }
};

struct Daemon {
    ScratchDataHome data_home;
    FakeAudioDevice session_device;
    FakeAudioDevice wake_device;
    FakeIpcServer ipc;
    std::shared_ptr<FakeSpeechModel> model = std::make_shared<FakeSpeechModel>();
    std::atomic<int> loads{0};
    DaemonCore core;

    explicit Daemon(Config config = quiet_config())
        : core(std::move(config), false, session_device, wake_device, ipc,
               [this](const std::string&) -> std::expected<StreamingSession::ModelPtr, std::string> {
                   loads.fetch_add(1);
                   return model;
               },
               [] {}) {}

    // Pumps the event queue until the daemon is idle again.
    bool wait_idle(std::chrono::milliseconds timeout = 5000ms) {
        auto until = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < until) {
            core.drain_events();
            if (core.mode() == DaemonCore::Mode::Idle) return true;
            std::this_thread::sleep_for(5ms);
        }
        return false;
    }
};

} // namespace

TEST_CASE("Daemon core", "[daemon]") {
    Daemon d;
    REQUIRE(d.core.init());

    SECTION("StatusWhenIdle") {
        auto resp = d.core.handle_command("status", {{"cmd", "status"}});
        REQUIRE(resp["status"] == "ok");
        REQUIRE(resp["state"] == "idle");
        REQUIRE(resp["wake"] == false);
    }

    SECTION("UnknownCommand") {
        auto resp = d.core.handle_command("toggle", {{"cmd", "toggle"}});
        REQUIRE(resp["status"] == "error");
        REQUIRE(resp["message"] == "unknown command");
    }

    SECTION("CancelWhenIdle") {
        auto resp = d.core.handle_command("cancel", {{"cmd", "cancel"}});
        REQUIRE(resp["status"] == "error");
    }

    SECTION("WakeNeedsBoolean") {
        auto resp = d.core.handle_command("wake", {{"cmd", "wake"}, {"enable", "yes"}});
        REQUIRE(resp["status"] == "error");
        REQUIRE_FALSE(d.core.wake_enabled());
    }

    SECTION("ListenThenCancel") {
        auto resp = d.core.handle_command("listen", {{"cmd", "listen"}});
        REQUIRE(resp["status"] == "ok");
        REQUIRE(resp["subscribe"] == true);
        d.core.add_subscriber(kClientFd, false);
        REQUIRE(d.core.mode() == DaemonCore::Mode::Session);

        // A second turn cannot start while one is running
        auto busy = d.core.handle_command("listen", {{"cmd", "listen"}});
        REQUIRE(busy["status"] == "error");

        auto cancel = d.core.handle_command("cancel", {{"cmd", "cancel"}});
        REQUIRE(cancel["status"] == "ok");
        REQUIRE(d.wait_idle());

        auto results = d.ipc.events_for(kClientFd, "result");
        REQUIRE(results.size() == 1);
        REQUIRE(results[0]["text"] == "No speech detected");
        REQUIRE(d.ipc.events_for(kClientFd, "ended").size() == 1);
        REQUIRE(d.ipc.sent.back().second["event"] == "ended");
        REQUIRE_FALSE(d.session_device.is_open());

        // The finished turn's subscriber is dropped
        size_t before = d.ipc.sent.size();
        d.core.handle_command("listen", {{"cmd", "listen"}});
        d.core.handle_command("cancel", {{"cmd", "cancel"}});
        REQUIRE(d.wait_idle());
        REQUIRE(d.ipc.sent.size() == before);
    }

    SECTION("WatchersSeeEveryTurn") {
        auto resp = d.core.handle_command("watch", {{"cmd", "watch"}});
        REQUIRE(resp["persistent"] == true);
        d.core.add_subscriber(kWatcherFd, true);

        for (int turn = 0; turn < 2; ++turn) {
            d.core.handle_command("listen", {{"cmd", "listen"}});
            d.core.handle_command("cancel", {{"cmd", "cancel"}});
            REQUIRE(d.wait_idle());
        }
        REQUIRE(d.ipc.events_for(kWatcherFd, "ended").size() == 2);

        d.core.remove_client(kWatcherFd);
        size_t before = d.ipc.sent.size();
        d.core.handle_command("listen", {{"cmd", "listen"}});
        d.core.handle_command("cancel", {{"cmd", "cancel"}});
        REQUIRE(d.wait_idle());
        REQUIRE(d.ipc.sent.size() == before);
    }

    SECTION("ModelsAreLoadedOncePerPath") {
        for (int turn = 0; turn < 2; ++turn) {
            d.core.handle_command("listen", {{"cmd", "listen"}});
            d.core.handle_command("cancel", {{"cmd", "cancel"}});
            REQUIRE(d.wait_idle());
        }
        REQUIRE(d.loads.load() == 2);
    }

    SECTION("TrainValidatesInput") {
        auto resp = d.core.handle_command("train", {{"cmd", "train"}, {"phrase", "!!"}});
        REQUIRE(resp["status"] == "error");
        resp = d.core.handle_command("train", {{"cmd", "train"}, {"phrase", "kiri"}, {"samples", 0}});
        REQUIRE(resp["status"] == "error");
        resp = d.core.handle_command("train", {{"cmd", "train"}, {"phrase", "kiri"}, {"samples", "five"}});
        REQUIRE(resp["status"] == "error");
        resp = d.core.handle_command("train", {{"cmd", "train"}, {"phrase", 42}});
        REQUIRE(resp["status"] == "error");
        REQUIRE(d.core.mode() == DaemonCore::Mode::Idle);
    }

    SECTION("InitCreatesWakeWordDirectory") {
        REQUIRE(std::filesystem::is_directory(d.data_home.path / "kiri" / "wakewords"));
    }

    SECTION("TrainCanBeCancelled") {
        auto resp = d.core.handle_command("train", {{"cmd", "train"}, {"phrase", "test phrase"}, {"samples", 3}});
        REQUIRE(resp["status"] == "ok");
        d.core.add_subscriber(kClientFd, false);
        REQUIRE(d.core.state_name() == "training");

        // Wait for the first prompt, then cancel the recording in progress
        for (int i = 0; i < 200 && d.ipc.events_for(kClientFd, "prompt").empty(); ++i) {
            d.core.drain_events();
            std::this_thread::sleep_for(5ms);
        }
        REQUIRE(d.ipc.events_for(kClientFd, "prompt").size() >= 1);
        d.core.handle_command("cancel", {{"cmd", "cancel"}});
        REQUIRE(d.wait_idle());

        auto errors = d.ipc.events_for(kClientFd, "error");
        REQUIRE(errors.size() == 1);
        REQUIRE(errors[0]["text"] == "training: cancelled");
        REQUIRE(d.ipc.events_for(kClientFd, "ended").size() == 1);
    }

    d.core.shutdown();
}

#pragma once

#include "audio/audio_capture.hpp"
#include "config.hpp"
#include "event_channel.hpp"
#include "platform/audio_device.hpp"
#include "platform/ipc_server.hpp"
#include "session/session_event.hpp"
#include "session/streaming_session.hpp"
#include "wakeword/detector.hpp"

#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <vector>

class DaemonCore {
public:
    using ModelLoader = StreamingSession::ModelLoader;
    using NotifyCallback = std::function<void()>;

    enum class Mode { Idle, Session, Training };

    DaemonCore(Config config, bool verbose,
               AudioDevice& session_device, AudioDevice& wake_device,
               IpcServer& ipc, ModelLoader loader, NotifyCallback notify);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    bool init();

    // A response carrying "subscribe": true asks the caller to register the
    // client for the event stream of the run it just started.
    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd);

    void add_subscriber(int fd, bool persistent);
    void remove_client(int fd);

    // Called from the event loop when workers have queued events.
    void drain_events();

    Mode mode() const { return mode_; }
    bool wake_enabled() const { return wake_worker_.joinable(); }
    std::string state_name() const;

    void shutdown();

private:
    nlohmann::json handle_listen(const nlohmann::json& cmd);
    nlohmann::json handle_cancel(const nlohmann::json& cmd);
    nlohmann::json handle_status(const nlohmann::json& cmd);
    nlohmann::json handle_wake(const nlohmann::json& cmd);
    nlohmann::json handle_train(const nlohmann::json& cmd);
    nlohmann::json handle_watch(const nlohmann::json& cmd);

    void start_session();
    void end_run();

    std::expected<void, std::string> start_wake();
    void stop_wake();
    std::expected<std::unique_ptr<WakeMatcher>, std::string> make_matcher();

    std::expected<StreamingSession::ModelPtr, std::string> load_model(const std::string& path);

    void broadcast(const SessionEvent& ev);
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    IpcServer& ipc_;
    ModelLoader loader_;

    EventChannel<SessionEvent> events_;
    AudioCapture session_capture_;
    AudioCapture wake_capture_;

    std::mutex model_mutex_;
    std::map<std::string, StreamingSession::ModelPtr> models_;

    Mode mode_ = Mode::Idle;
    std::unique_ptr<StreamingSession> session_;
    std::unique_ptr<WakeWordDetector> detector_;

    struct Subscriber {
        int fd;
        bool persistent; // watchers stay subscribed across runs
    };
    std::vector<Subscriber> subscribers_;

    // Declared last so workers are joined before the state they use goes away
    std::jthread run_worker_;
    std::jthread wake_worker_;
};

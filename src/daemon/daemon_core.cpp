#include "daemon_core.hpp"

#include "platform/platform_paths.hpp"
#include "wakeword/lexical_matcher.hpp"
#include "wakeword/template_matcher.hpp"
#include "wakeword/trainer.hpp"
#include "wakeword/wakeword_model.hpp"
#include "whisper/transcription_engine.hpp"

#include <filesystem>
#include <format>
#include <print>

namespace {

CaptureParams capture_params(const Config& c) {
    return CaptureParams{
        .sample_rate = c.audio.capture_rate,
        .channels = c.audio.channels,
        .vad = {.threshold = c.audio.speech_threshold, .min_speech_s = c.audio.speech_min_s},
        .max_duration_s = c.audio.max_record_s,
    };
}

nlohmann::json error_response(const std::string& msg) {
    return {{"status", "error"}, {"message", msg}};
}

} // namespace

DaemonCore::DaemonCore(Config config, bool verbose,
                       AudioDevice& session_device, AudioDevice& wake_device,
                       IpcServer& ipc, ModelLoader loader, NotifyCallback notify)
    : config_(std::move(config)), verbose_(verbose),
      ipc_(ipc), loader_(std::move(loader)),
      events_(std::move(notify)),
      session_capture_(session_device, capture_params(config_)),
      wake_capture_(wake_device, capture_params(config_)) {}

DaemonCore::~DaemonCore() {
    shutdown();
}

bool DaemonCore::init() {
    std::error_code ec;
    std::filesystem::create_directories(platform::wakeword_dir(), ec);
    if (ec) {
        std::println(stderr, "Warning: cannot create {}: {}", platform::wakeword_dir(), ec.message());
    }

    if (config_.wake.enabled) {
        if (auto res = start_wake(); !res) {
            std::println(stderr, "Warning: wake word detection disabled: {}", res.error());
        }
    }
    return true;
}

nlohmann::json DaemonCore::handle_command(const std::string& cmd_str,
                                          const nlohmann::json& cmd) {
    if (cmd_str == "listen") return handle_listen(cmd);
    if (cmd_str == "cancel") return handle_cancel(cmd);
    if (cmd_str == "status") return handle_status(cmd);
    if (cmd_str == "wake") return handle_wake(cmd);
    if (cmd_str == "train") return handle_train(cmd);
    if (cmd_str == "watch") return handle_watch(cmd);
    return error_response("unknown command");
}

nlohmann::json DaemonCore::handle_listen(const nlohmann::json& /*cmd*/) {
    if (mode_ != Mode::Idle) {
        return error_response("busy: " + state_name());
    }
    start_session();
    return {{"status", "ok"}, {"message", "listening"}, {"subscribe", true}};
}

nlohmann::json DaemonCore::handle_cancel(const nlohmann::json& /*cmd*/) {
    switch (mode_) {
        case Mode::Session:
            session_->cancel();
            break;
        case Mode::Training:
            run_worker_.request_stop();
            break;
        case Mode::Idle:
            return error_response("nothing to cancel");
    }
    log("Cancel requested");
    return {{"status", "ok"}, {"message", "cancelling"}};
}

nlohmann::json DaemonCore::handle_status(const nlohmann::json& /*cmd*/) {
    return {{"status", "ok"}, {"state", state_name()}, {"wake", wake_enabled()}};
}

nlohmann::json DaemonCore::handle_wake(const nlohmann::json& cmd) {
    if (!cmd.contains("enable") || !cmd["enable"].is_boolean()) {
        return error_response("wake: expected {\"enable\": true|false}");
    }

    if (cmd["enable"].get<bool>()) {
        if (!wake_enabled()) {
            if (auto res = start_wake(); !res) return error_response(res.error());
        }
    } else {
        stop_wake();
    }
    return {{"status", "ok"}, {"wake", wake_enabled()}};
}

nlohmann::json DaemonCore::handle_train(const nlohmann::json& cmd) {
    if (mode_ != Mode::Idle) {
        return error_response("busy: " + state_name());
    }

    if (!cmd.contains("phrase") || !cmd["phrase"].is_string()) {
        return error_response("train: a phrase is required");
    }
    std::string phrase = cmd["phrase"].get<std::string>();
    if (slugify(phrase).empty()) {
        return error_response("train: a phrase is required");
    }

    uint32_t samples = config_.wake.training_samples;
    if (cmd.contains("samples")) {
        const auto& n = cmd["samples"];
        if (!n.is_number_integer() || n.get<int64_t>() <= 0) {
            return error_response("train: samples must be positive");
        }
        samples = static_cast<uint32_t>(n.get<int64_t>());
    }

    mode_ = Mode::Training;
    if (detector_) detector_->set_paused(true);
    log(std::format("Training \"{}\" with {} samples", phrase, samples));

    TrainerParams params{
        .output_dir = platform::wakeword_dir(),
        .sample_rate = config_.audio.capture_rate,
        .samples = samples,
        .threshold = config_.wake.template_threshold,
    };

    float silence_s = config_.wake.training_silence_s;
    run_worker_ = std::jthread([this, phrase, params, silence_s](std::stop_token st) {
        // Cancellation also interrupts the recording in progress
        WakeWordTrainer trainer(
            [this, st, silence_s] { return session_capture_.record_until_silence(silence_s, st); },
            params, verbose_);

        WakeWordTrainer::Callbacks cb{
            .on_prompt = [this, &phrase](uint32_t i, uint32_t total) {
                events_.send(SessionEvent::with_text(
                    SessionEvent::Kind::Prompt, std::format("Say \"{}\" ({}/{})", phrase, i, total)));
            },
            .on_sample = [this](uint32_t i, bool accepted, const std::string& note) {
                events_.send(SessionEvent::with_text(
                    SessionEvent::Kind::Sample,
                    std::format("sample {} {}: {}", i, accepted ? "accepted" : "rejected", note)));
            },
        };

        auto res = trainer.train(phrase, cb, st);
        if (res) {
            events_.send(SessionEvent::with_text(SessionEvent::Kind::Trained, *res));
        } else {
            std::println(stderr, "{}", res.error());
            events_.send(SessionEvent::with_text(SessionEvent::Kind::Error, res.error()));
        }
        events_.send(SessionEvent::ended());
    });

    return {{"status", "ok"}, {"message", "training"}, {"subscribe", true}};
}

nlohmann::json DaemonCore::handle_watch(const nlohmann::json& /*cmd*/) {
    return {{"status", "ok"}, {"message", "watching"}, {"subscribe", true}, {"persistent", true}};
}

void DaemonCore::start_session() {
    session_ = std::make_unique<StreamingSession>(
        config_, session_capture_,
        [this](const std::string& path) { return load_model(path); },
        events_, verbose_);

    mode_ = Mode::Session;
    if (detector_) detector_->set_paused(true);
    log("Session started");

    run_worker_ = std::jthread([this](std::stop_token st) { session_->run(st); });
}

void DaemonCore::end_run() {
    if (run_worker_.joinable()) run_worker_.join();

    Mode finished = mode_;
    session_.reset();
    mode_ = Mode::Idle;
    std::erase_if(subscribers_, [](const Subscriber& s) { return !s.persistent; });

    if (finished == Mode::Training && wake_enabled()) {
        // Pick up the freshly written template
        stop_wake();
        if (auto res = start_wake(); !res) {
            std::println(stderr, "wake: restart failed: {}", res.error());
        }
    }
    if (detector_) detector_->set_paused(false);
    log("Back to idle");
}

void DaemonCore::drain_events() {
    for (auto& ev : events_.drain()) {
        broadcast(ev);

        if (ev.kind == SessionEvent::Kind::Wake && mode_ == Mode::Idle) {
            log("Wake word \"" + ev.text + "\", starting session");
            start_session();
        } else if (ev.kind == SessionEvent::Kind::Ended && mode_ != Mode::Idle) {
            end_run();
        }
    }
}

std::expected<void, std::string> DaemonCore::start_wake() {
    if (wake_enabled()) return {};

    auto matcher = make_matcher();
    if (!matcher) return std::unexpected(matcher.error());

    detector_ = std::make_unique<WakeWordDetector>(wake_capture_, std::move(*matcher),
                                                   config_.wake.cooldown_s, verbose_);
    if (mode_ != Mode::Idle) detector_->set_paused(true);

    wake_worker_ = std::jthread([this](std::stop_token st) {
        auto res = detector_->listen(st, [this](const WakeDetection& d) {
            events_.send(SessionEvent::with_text(SessionEvent::Kind::Wake, d.name));
        });
        if (!res) {
            std::println(stderr, "wake: detector stopped: {}", res.error());
        }
    });
    log("Wake word detection enabled");
    return {};
}

void DaemonCore::stop_wake() {
    if (!wake_worker_.joinable()) return;
    wake_worker_.request_stop();
    wake_worker_.join();
    wake_worker_ = {};
    detector_.reset();
    log("Wake word detection disabled");
}

std::expected<std::unique_ptr<WakeMatcher>, std::string> DaemonCore::make_matcher() {
    const auto& w = config_.wake;

    if (w.matcher != "lexical") {
        auto models = load_models(platform::wakeword_dir(), config_.audio.capture_rate, config_.audio.channels);
        if (!models.empty()) {
            log(std::format("Loaded {} wake word template(s)", models.size()));
            TemplateMatcher::Params params{
                .sample_rate = config_.audio.capture_rate,
                .min_hits = w.min_hits,
                .level_gate = w.vad_threshold,
            };
            return std::make_unique<TemplateMatcher>(std::move(models), params);
        }
        log("No trained wake words, falling back to transcript matching");
    }

    if (w.phrases.empty()) {
        return std::unexpected("wake: no phrases configured");
    }
    auto model = load_model(config_.fast_model_path());
    if (!model) {
        return std::unexpected("wake: " + model.error());
    }

    LexicalMatcher::Params params{
        .capture_rate = config_.audio.capture_rate,
        .model_rate = config_.audio.model_rate,
        .min_audio_s = w.min_audio_s,
        .level_gate = w.vad_threshold,
        .tolerance = w.match_tolerance,
        .stride_s = w.stride_s,
    };
    return std::make_unique<LexicalMatcher>(
        TranscriptionEngine(*model, config_.model.language, verbose_), w.phrases, params);
}

std::expected<StreamingSession::ModelPtr, std::string> DaemonCore::load_model(const std::string& path) {
    {
        std::lock_guard lock(model_mutex_);
        if (auto it = models_.find(path); it != models_.end()) return it->second;
    }

    // Loading is slow; keep it outside the lock
    auto model = loader_(path);
    if (!model) return model;

    std::lock_guard lock(model_mutex_);
    auto [it, inserted] = models_.emplace(path, *model);
    if (inserted) log("Loaded model " + path);
    return it->second;
}

void DaemonCore::add_subscriber(int fd, bool persistent) {
    subscribers_.push_back({fd, persistent});
}

void DaemonCore::remove_client(int fd) {
    std::erase_if(subscribers_, [fd](const Subscriber& s) { return s.fd == fd; });
}

void DaemonCore::broadcast(const SessionEvent& ev) {
    if (subscribers_.empty()) return;
    auto msg = to_json(ev);
    for (const auto& s : subscribers_) {
        ipc_.send(s.fd, msg);
    }
}

std::string DaemonCore::state_name() const {
    switch (mode_) {
        case Mode::Idle: return "idle";
        case Mode::Training: return "training";
        case Mode::Session: return session_ ? std::string(to_string(session_->state())) : "idle";
    }
    return "idle";
}

void DaemonCore::shutdown() {
    stop_wake();

    if (mode_ == Mode::Session && session_) {
        log("Waiting for the active session to finish...");
        session_->cancel();
    }
    if (run_worker_.joinable()) {
        run_worker_.request_stop();
        run_worker_.join();
    }

    // Flush what the workers left behind, but never start a new run
    for (auto& ev : events_.drain()) broadcast(ev);
    session_.reset();
    mode_ = Mode::Idle;
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[kiri] {}", msg);
    }
}

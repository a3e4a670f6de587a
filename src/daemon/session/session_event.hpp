#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

enum class SessionState { Loading, Listening, Transcribing, Result, Error };

inline std::string_view to_string(SessionState s) {
    switch (s) {
        case SessionState::Loading: return "loading";
        case SessionState::Listening: return "listening";
        case SessionState::Transcribing: return "transcribing";
        case SessionState::Result: return "result";
        case SessionState::Error: return "error";
    }
    return "unknown";
}

// One message of the ordered event stream delivered to clients.
struct SessionEvent {
    enum class Kind {
        State,
        Level,
        Partial,
        Deliver,
        Result,
        Error,
        Ended,
        Wake,
        // Training progress
        Prompt,
        Sample,
        Trained,
    };

    Kind kind = Kind::State;
    SessionState state = SessionState::Loading;
    std::string text;
    float level = 0.0f;

    static SessionEvent state_change(SessionState s) { return {.kind = Kind::State, .state = s}; }
    static SessionEvent level_reading(float rms) { return {.kind = Kind::Level, .level = rms}; }
    static SessionEvent with_text(Kind k, std::string t) { return {.kind = k, .text = std::move(t)}; }
    static SessionEvent ended() { return {.kind = Kind::Ended}; }
};

inline std::string_view to_string(SessionEvent::Kind k) {
    using K = SessionEvent::Kind;
    switch (k) {
        case K::State: return "state";
        case K::Level: return "level";
        case K::Partial: return "partial";
        case K::Deliver: return "deliver";
        case K::Result: return "result";
        case K::Error: return "error";
        case K::Ended: return "ended";
        case K::Wake: return "wake";
        case K::Prompt: return "prompt";
        case K::Sample: return "sample";
        case K::Trained: return "trained";
    }
    return "unknown";
}

// Wire form: {"event": kind, ...} with "state", "level" or "text" by kind.
inline nlohmann::json to_json(const SessionEvent& ev) {
    nlohmann::json j = {{"event", std::string(to_string(ev.kind))}};
    switch (ev.kind) {
        case SessionEvent::Kind::State:
            j["state"] = std::string(to_string(ev.state));
            break;
        case SessionEvent::Kind::Level:
            j["level"] = ev.level;
            break;
        case SessionEvent::Kind::Ended:
            break;
        default:
            j["text"] = ev.text;
            break;
    }
    return j;
}

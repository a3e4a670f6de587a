#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <nlohmann/json.hpp>
#include <print>
#include <string>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  listen [--levels]               Dictate; prints partial and final text");
    std::println(stderr, "  cancel                          Stop the active session or training run");
    std::println(stderr, "  status                          Show daemon status");
    std::println(stderr, "  wake on|off                     Toggle wake word detection");
    std::println(stderr, "  train PHRASE [--samples N]      Record samples and build a wake word");
    std::println(stderr, "  watch                           Print every event until interrupted");
}

// Prints one event. Returns false when the stream is finished.
static bool print_event(const json& ev, bool levels, bool persistent, int& exit_code) {
    auto kind = ev.value("event", "");
    auto text = ev.value("text", "");

    if (kind == "state") {
        std::println(stderr, "[{}]", ev.value("state", ""));
    } else if (kind == "level") {
        if (levels) std::println(stderr, "level {:.3f}", ev.value("level", 0.0));
    } else if (kind == "partial") {
        std::println(stderr, "... {}", text);
    } else if (kind == "deliver") {
        std::println(stderr, "> {}", text);
    } else if (kind == "result" || kind == "trained") {
        std::println("{}", text);
    } else if (kind == "error") {
        std::println(stderr, "Error: {}", text);
        exit_code = 1;
    } else if (kind == "wake") {
        std::println(stderr, "wake word: {}", text);
    } else if (kind == "prompt" || kind == "sample") {
        std::println(stderr, "{}", text);
    } else if (kind == "ended") {
        return persistent;
    }
    return true;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::string positional;
    uint32_t samples = 0;
    bool levels = false;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--samples" && i + 1 < argc) {
            samples = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
        } else if (arg == "--levels") {
            levels = true;
        } else if (positional.empty()) {
            positional = arg;
        } else {
            positional += " " + arg;
        }
    }

    json cmd;
    bool streaming = false;
    bool persistent = false;

    if (command == "listen") {
        cmd = {{"cmd", "listen"}};
        streaming = true;
    } else if (command == "cancel") {
        cmd = {{"cmd", "cancel"}};
    } else if (command == "status") {
        cmd = {{"cmd", "status"}};
    } else if (command == "wake") {
        if (positional != "on" && positional != "off") {
            usage(argv[0]);
            return 1;
        }
        cmd = {{"cmd", "wake"}, {"enable", positional == "on"}};
    } else if (command == "train") {
        if (positional.empty()) {
            std::println(stderr, "train: missing phrase");
            return 1;
        }
        cmd = {{"cmd", "train"}, {"phrase", positional}};
        if (samples > 0) cmd["samples"] = samples;
        streaming = true;
    } else if (command == "watch") {
        cmd = {{"cmd", "watch"}};
        streaming = true;
        persistent = true;
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is kiri running?");
        return 1;
    }

    if (!client.send(cmd)) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    // Events may arrive before the reply; the reply is the first message
    // without an "event" key.
    json response;
    int exit_code = 0;
    bool stream_done = false;
    while (true) {
        if (!client.recv(response)) {
            std::println(stderr, "No response from daemon (timeout)");
            return 1;
        }
        if (!response.contains("event")) break;
        if (!print_event(response, levels, persistent, exit_code)) stream_done = true;
    }

    if (response.value("status", "") == "error") {
        std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        return 1;
    }

    if (command == "status") {
        std::println("State: {}", response.value("state", "unknown"));
        std::println("Wake word: {}", response.value("wake", false) ? "on" : "off");
        return 0;
    }
    if (command == "wake") {
        std::println("Wake word: {}", response.value("wake", false) ? "on" : "off");
        return 0;
    }
    if (!streaming) {
        std::println("{}", response.value("message", "OK"));
        return 0;
    }

    while (!stream_done) {
        json ev;
        if (!client.recv(ev, -1)) {
            std::println(stderr, "Connection to daemon lost");
            return 1;
        }
        if (!print_event(ev, levels, persistent, exit_code)) break;
    }
    return exit_code;
}

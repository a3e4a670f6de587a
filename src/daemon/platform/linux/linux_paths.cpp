#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg) return std::string(xdg) + "/kiri";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/kiri";
}

std::string data_dir() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg) return std::string(xdg) + "/kiri";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.local/share/kiri";
}

std::string models_dir() {
    auto dir = data_dir();
    if (dir.empty()) return {};
    return dir + "/models";
}

std::string wakeword_dir() {
    auto dir = data_dir();
    if (dir.empty()) return {};
    return dir + "/wakewords";
}

std::string ipc_endpoint() {
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg) return std::string(xdg) + "/kiri.sock";
    return "/tmp/kiri.sock";
}

} // namespace platform

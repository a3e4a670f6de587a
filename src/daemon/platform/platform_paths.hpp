#pragma once

#include <string>

namespace platform {

// All return an empty string when no home directory can be determined.
std::string config_dir();
std::string data_dir();
std::string models_dir();
std::string wakeword_dir();

std::string ipc_endpoint();

} // namespace platform

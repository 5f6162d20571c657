#pragma once

#include <string>

namespace platform {

// Per-user configuration directory for stt-relay, empty if it cannot be determined.
std::string config_dir();

} // namespace platform

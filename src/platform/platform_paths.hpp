#pragma once

#include <string>

namespace platform {

// Directory holding config.json, empty if it cannot be determined.
std::string config_dir();

// Directory for transient script files.
std::string temp_dir();

} // namespace platform

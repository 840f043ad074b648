#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// Returns the per-user configuration directory:
// $XDG_CONFIG_HOME, else ~/.config on Unix; %APPDATA% on Windows.
std::filesystem::path config_dir();

// Returns the value of an environment variable, or "" if unset.
std::string get_env(const char* name);

} // namespace platform

#include "platform.hpp"
#include <cstdlib>

namespace fs = std::filesystem;

namespace platform {

std::string get_env(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

fs::path home_dir() {
#ifdef _WIN32
    std::string home = get_env("USERPROFILE");
    if (home.empty()) home = get_env("HOME");
#else
    std::string home = get_env("HOME");
#endif
    if (home.empty()) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

fs::path config_dir() {
#ifdef _WIN32
    std::string appdata = get_env("APPDATA");
    if (!appdata.empty()) return fs::path(appdata);
    return home_dir() / "AppData" / "Roaming";
#else
    std::string xdg = get_env("XDG_CONFIG_HOME");
    if (!xdg.empty() && fs::path(xdg).is_absolute()) return fs::path(xdg);
    return home_dir() / ".config";
#endif
}

} // namespace platform

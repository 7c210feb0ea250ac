#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <string_view>

namespace platform {

namespace {

constexpr std::string_view kConfigFile = "/mimic/config.json";

// XDG base directories must be absolute; anything else is ignored.
const char* xdg_env(const char* name) {
    const char* value = std::getenv(name);
    return value && value[0] == '/' ? value : nullptr;
}

} // namespace

std::vector<std::string> config_search_path() {
    std::vector<std::string> paths;

    if (const char* xdg = xdg_env("XDG_CONFIG_HOME")) {
        paths.push_back(std::string(xdg) + std::string(kConfigFile));
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        paths.push_back(std::string(home) + "/.config" + std::string(kConfigFile));
    }

    const char* dirs_env = std::getenv("XDG_CONFIG_DIRS");
    std::string_view dirs = dirs_env && *dirs_env ? dirs_env : "/etc/xdg";
    while (!dirs.empty()) {
        auto sep = dirs.find(':');
        auto dir = dirs.substr(0, sep);
        if (dir.starts_with('/')) paths.push_back(std::string(dir) + std::string(kConfigFile));
        if (sep == std::string_view::npos) break;
        dirs.remove_prefix(sep + 1);
    }
    return paths;
}

} // namespace platform

#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <charconv>
#include <filesystem>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("selector")) {
            auto& s = j["selector"];
            if (s.contains("window")) {
                auto& w = s["window"];
                if (w.is_string()) {
                    cfg.selection.window = parse_window_id(w.get<std::string>());
                    if (!cfg.selection.window) {
                        std::println(stderr, "config: invalid window id {}", w.dump());
                    }
                } else if (w.is_number_unsigned()) {
                    cfg.selection.window = w.get<WindowHandle>();
                } else {
                    std::println(stderr, "config: invalid window id {}", w.dump());
                }
            }
            if (s.contains("class")) cfg.selection.window_class = s["class"].get<std::string>();
            if (s.contains("name")) cfg.selection.name = s["name"].get<std::string>();
            if (s.contains("pid")) cfg.selection.pid = s["pid"].get<int>();
            if (s.contains("all")) cfg.selection.all = s["all"].get<bool>();
        }

        if (j.contains("layout")) {
            auto& l = j["layout"];
            if (l.contains("target")) cfg.layout.target = l["target"].get<int>();
            if (l.contains("default")) cfg.layout.default_group = l["default"].get<int>();
        }

        if (j.contains("match")) {
            auto& m = j["match"];
            if (m.contains("exact")) cfg.match.exact = m["exact"].get<bool>();
            if (m.contains("case_sensitive")) cfg.match.case_sensitive = m["case_sensitive"].get<bool>();
        }

        if (j.contains("display")) cfg.display = j["display"].get<std::string>();
        if (j.contains("verbose")) cfg.verbose = j["verbose"].get<bool>();

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    for (const auto& path : platform::config_search_path()) {
        std::error_code ec;
        if (fs::exists(path, ec)) return load(path);
    }
    return Config{};
}

std::expected<Selector, std::string> Config::make_selector() const {
    const auto& s = selection;
    int criteria = (s.window ? 1 : 0) + (s.window_class ? 1 : 0) +
                   (s.name ? 1 : 0) + (s.pid ? 1 : 0);
    if (criteria == 0) {
        return std::unexpected("no window selected (use --window, --class, --name or --pid)");
    }
    if (criteria > 1) {
        return std::unexpected("only one of --window, --class, --name, --pid may be given");
    }

    if (s.window) {
        if (*s.window == 0) return std::unexpected("window id must not be 0");
        if (s.all) {
            std::println(stderr, "warning: --all has no effect with --window, ignoring");
        }
        return Selector::by_id(*s.window);
    }
    if (s.window_class) {
        if (s.window_class->empty()) return std::unexpected("class pattern must not be empty");
        return Selector::by_class(*s.window_class, s.all, match);
    }
    if (s.name) {
        if (s.name->empty()) return std::unexpected("name pattern must not be empty");
        return Selector::by_name(*s.name, s.all, match);
    }
    if (*s.pid <= 0) return std::unexpected(std::format("invalid pid {}", *s.pid));
    return Selector::by_pid(*s.pid, s.all);
}

std::expected<void, std::string> Config::validate_layout(int group_count) const {
    auto check = [group_count](const char* what, int group) -> std::expected<void, std::string> {
        if (group < 0 || group >= group_count) {
            return std::unexpected(std::format(
                "{} layout index {} not configured (keyboard has {} group{}, valid: 0-{})",
                what, group, group_count, group_count == 1 ? "" : "s", group_count - 1));
        }
        return {};
    };

    if (auto r = check("target", layout.target); !r) return r;
    if (auto r = check("default", layout.default_group); !r) return r;
    if (layout.target == layout.default_group) {
        std::println(stderr, "warning: target layout equals default layout ({}), nothing to switch",
                     layout.target);
    }
    return {};
}

std::optional<WindowHandle> parse_window_id(std::string_view text) {
    int base = 10;
    if (text.starts_with("0x") || text.starts_with("0X")) {
        text.remove_prefix(2);
        base = 16;
    }
    if (text.empty()) return std::nullopt;

    WindowHandle value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value, base);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

std::optional<int> parse_index(std::string_view text) {
    if (text.empty()) return std::nullopt;

    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value < 0) return std::nullopt;
    return value;
}

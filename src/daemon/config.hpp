#pragma once

#include "window/selector.hpp"
#include "window/window_record.hpp"

#include <expected>
#include <optional>
#include <string>
#include <string_view>

struct Config {
    // Exactly one criterion must be set.
    struct Selection {
        std::optional<WindowHandle> window;
        std::optional<std::string> window_class;
        std::optional<std::string> name;
        std::optional<int> pid;
        bool all = false;  // keep matching new windows
    } selection;

    struct Layout {
        int target = 1;
        int default_group = 0;
    } layout;

    MatchOptions match;

    std::string display;  // empty: $DISPLAY
    bool verbose = false;

    static Config load(const std::string& path);
    static Config load_default();

    std::expected<Selector, std::string> make_selector() const;

    // Group indices must exist on a keyboard with `group_count` groups.
    std::expected<void, std::string> validate_layout(int group_count) const;
};

// Parses a window id as printed by xwininfo/xprop: decimal or 0x-prefixed hex.
std::optional<WindowHandle> parse_window_id(std::string_view text);

// Parses a non-negative decimal integer.
std::optional<int> parse_index(std::string_view text);

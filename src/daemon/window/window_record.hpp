#pragma once

#include <optional>
#include <string>

// X11 window id (XID). Kept as a plain integer so the portable core does not
// depend on Xlib headers.
using WindowHandle = unsigned long;

// Attributes the display server reported for a window. Unset fields mean
// "not known": the property is absent or could not be fetched yet.
struct WindowProperties {
    std::optional<std::string> window_class;  // "instance.class", e.g. "discord.discord"
    std::optional<std::string> title;         // _NET_WM_NAME or WM_NAME
    std::optional<int> pid;                   // _NET_WM_PID

    bool empty() const { return !window_class && !title && !pid; }
};

struct WindowRecord {
    WindowHandle handle = 0;
    std::optional<std::string> window_class;
    std::optional<std::string> title;
    std::optional<int> pid;
    bool is_target = false;
    bool is_focused = false;
};

#pragma once

#include "window/display_event.hpp"

#include <expected>
#include <optional>
#include <string>
#include <vector>

// Source of window lifecycle, property and focus events.
class DisplayServer {
public:
    virtual ~DisplayServer() = default;
    virtual bool connect(const std::string& display_name) = 0;
    virtual bool subscribe_window_events() = 0;
    // One Created event per window present now, with its properties.
    virtual std::vector<DisplayEvent> enumerate_windows() = 0;
    virtual std::optional<WindowHandle> get_focused_window() = 0;
    // FD for epoll registration.
    virtual int event_fd() const = 0;
    // True if events were already read off the socket and wait client-side.
    virtual bool has_queued_events() = 0;
    // Drains every pending event in arrival order. An error means the
    // connection is unusable.
    virtual std::expected<std::vector<DisplayEvent>, std::string> read_events() = 0;
};

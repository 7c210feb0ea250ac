#pragma once

#include "config.hpp"
#include "exit_code.hpp"
#include "layout/layout_switcher.hpp"
#include "layout/session_state.hpp"
#include "platform/keyboard_group.hpp"
#include "window/display_event.hpp"
#include "window/focus_tracker.hpp"
#include "window/selector.hpp"
#include "window/window_registry.hpp"

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <vector>

// Platform independent part of the daemon: registry, focus tracking and
// group switching for batches of display events.
class DaemonCore {
public:
    DaemonCore(const Config& config, Selector selector, KeyboardGroup& keyboard, bool verbose);

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    // Validates the layout indices, reads the keyboard's current group, seeds
    // the registry with the startup enumeration and applies the initial focus.
    ExitCode init(const std::vector<DisplayEvent>& windows, std::optional<WindowHandle> focused);

    // Applies events in order, then evaluates the layout once.
    std::expected<void, std::string> handle_batch(const std::vector<DisplayEvent>& events);

    // Restores the default group. Safe to call more than once.
    void shutdown();

    const SessionState& state() const { return state_; }
    const WindowRegistry& registry() const { return registry_; }
    std::optional<WindowHandle> focused() const { return tracker_.focused(); }
    size_t requests_issued() const { return switcher_.requests_issued(); }

private:
    void apply(const DisplayEvent& event);
    std::expected<void, std::string> evaluate();

    void log(const std::string& msg);

    bool verbose_;
    KeyboardGroup& keyboard_;
    Config config_;

    SessionState state_;
    WindowRegistry registry_;
    FocusTracker tracker_;
    LayoutSwitcher switcher_;
};

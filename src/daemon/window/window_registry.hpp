#pragma once

#include "window/selector.hpp"
#include "window/window_record.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>

// Live set of windows known to the display server and their match state.
//
// Non-continuous selectors (class/name/pid without "all") bind to the first
// window they match and keep that binding for the registry's lifetime, even if
// the window's attributes change. Once the bound window is destroyed nothing
// matches any more, including a new window that reuses its handle. Id
// selectors are plain handle equality.
class WindowRegistry {
public:
    explicit WindowRegistry(Selector selector);

    // Insert or update; fields missing from `props` keep their stored value.
    void upsert(WindowHandle handle, const WindowProperties& props);
    void upsert(WindowHandle handle, std::optional<std::string> window_class);

    // Returns true if the removed window held focus.
    bool remove(WindowHandle handle);

    std::optional<WindowRecord> lookup(WindowHandle handle) const;
    bool contains(WindowHandle handle) const { return windows_.contains(handle); }
    bool is_match(WindowHandle handle) const;

    // Marks `handle` focused (inserting an attribute-less record if needed)
    // and clears the previous holder.
    void focus(WindowHandle handle);
    // Clears the flag if `handle` holds it. Returns true if it did.
    bool unfocus(WindowHandle handle);
    std::optional<WindowHandle> focused() const { return focused_; }

    std::optional<WindowHandle> bound_window() const { return bound_; }
    const Selector& selector() const { return selector_; }

    size_t size() const { return windows_.size(); }
    size_t target_count() const;

private:
    void refresh_target(WindowRecord& record);

    Selector selector_;
    std::unordered_map<WindowHandle, WindowRecord> windows_;
    std::optional<WindowHandle> focused_;
    std::optional<WindowHandle> bound_;
    bool binding_spent_ = false;
};

#pragma once

#include "window/display_event.hpp"
#include "window/window_registry.hpp"

#include <optional>

enum class FocusChange {
    None,
    Gained,  // a window received focus
    Lost,    // the focused window lost focus or vanished; no replacement yet
};

// Applies display events to the registry, one at a time, in arrival order.
class FocusTracker {
public:
    explicit FocusTracker(WindowRegistry& registry);

    FocusChange apply(const DisplayEvent& event);

    std::optional<WindowHandle> focused() const { return registry_.focused(); }

private:
    WindowRegistry& registry_;
};

#pragma once

#include "layout/session_state.hpp"
#include "platform/keyboard_group.hpp"
#include "window/window_registry.hpp"

#include <cstddef>
#include <expected>
#include <optional>
#include <string>

struct GroupDecision {
    int group = 0;
    bool changed = false;  // a group-change request was issued
};

class LayoutSwitcher {
public:
    LayoutSwitcher(KeyboardGroup& keyboard, SessionState& state);

    // Target group if `focused` is a matching window, default group otherwise.
    // Issues a request only when the decision differs from the current group.
    // On failure the current group is left untouched.
    std::expected<GroupDecision, std::string> evaluate(std::optional<WindowHandle> focused,
                                                       const WindowRegistry& registry);

    std::expected<GroupDecision, std::string> restore_default();

    size_t requests_issued() const { return requests_; }

private:
    std::expected<GroupDecision, std::string> switch_to(int group);

    KeyboardGroup& keyboard_;
    SessionState& state_;
    size_t requests_ = 0;
};

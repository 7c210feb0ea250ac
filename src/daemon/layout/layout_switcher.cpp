#include "layout/layout_switcher.hpp"

#include <format>

LayoutSwitcher::LayoutSwitcher(KeyboardGroup& keyboard, SessionState& state)
    : keyboard_(keyboard), state_(state) {}

std::expected<GroupDecision, std::string> LayoutSwitcher::evaluate(
    std::optional<WindowHandle> focused, const WindowRegistry& registry) {
    bool target = focused && registry.is_match(*focused);
    return switch_to(target ? state_.target_group : state_.default_group);
}

std::expected<GroupDecision, std::string> LayoutSwitcher::restore_default() {
    return switch_to(state_.default_group);
}

std::expected<GroupDecision, std::string> LayoutSwitcher::switch_to(int group) {
    if (group == state_.current_group) {
        return GroupDecision{.group = group, .changed = false};
    }

    auto res = keyboard_.lock_group(group);
    if (!res) {
        return std::unexpected(std::format("group change {} -> {} rejected: {}",
                                           state_.current_group, group, res.error()));
    }

    state_.current_group = group;
    requests_++;
    return GroupDecision{.group = group, .changed = true};
}

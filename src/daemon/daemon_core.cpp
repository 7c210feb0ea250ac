#include "daemon_core.hpp"

#include <format>
#include <print>
#include <utility>

DaemonCore::DaemonCore(const Config& config, Selector selector, KeyboardGroup& keyboard,
                       bool verbose)
    : verbose_(verbose), keyboard_(keyboard), config_(config),
      registry_(std::move(selector)), tracker_(registry_),
      switcher_(keyboard_, state_) {}

ExitCode DaemonCore::init(const std::vector<DisplayEvent>& windows,
                          std::optional<WindowHandle> focused) {
    int groups = keyboard_.group_count();
    if (groups <= 0) {
        std::println(stderr, "Keyboard reports no layout groups (is XKB configured?)");
        return ExitCode::Config;
    }
    if (auto valid = config_.validate_layout(groups); !valid) {
        std::println(stderr, "Configuration error: {}", valid.error());
        return ExitCode::Config;
    }

    auto current = keyboard_.current_group();
    if (!current) {
        std::println(stderr, "Failed to query keyboard group: {}", current.error());
        return ExitCode::Connection;
    }

    state_.current_group = *current;
    state_.default_group = config_.layout.default_group;
    state_.target_group = config_.layout.target;

    if (verbose_) {
        auto names = keyboard_.group_names();
        for (size_t i = 0; i < names.size(); i++) {
            log(std::format("group {}: {}{}", i, names[i],
                            static_cast<int>(i) == state_.target_group ? " (target)" : ""));
        }
        log(std::format("selecting {}", registry_.selector().describe()));
    }

    for (const auto& ev : windows) {
        tracker_.apply(ev);
    }
    log(std::format("{} windows known, {} matching", registry_.size(), registry_.target_count()));
    if (auto bound = registry_.bound_window()) {
        log(std::format("bound to window 0x{:x}", *bound));
    }

    if (focused) {
        tracker_.apply(DisplayEvent::focus_in(*focused));
    }

    if (auto res = evaluate(); !res) {
        std::println(stderr, "{}", res.error());
        return ExitCode::GroupRejected;
    }
    return ExitCode::Ok;
}

std::expected<void, std::string> DaemonCore::handle_batch(const std::vector<DisplayEvent>& events) {
    for (const auto& ev : events) {
        apply(ev);
    }
    return evaluate();
}

void DaemonCore::shutdown() {
    auto res = switcher_.restore_default();
    if (!res) {
        std::println(stderr, "Failed to restore default layout: {}", res.error());
        return;
    }
    if (res->changed) {
        log(std::format("restored default group {}", res->group));
    }
}

void DaemonCore::apply(const DisplayEvent& event) {
    if (event.kind == DisplayEvent::Kind::GroupChanged) {
        if (event.group != state_.current_group) {
            log(std::format("group changed externally: {} -> {}", state_.current_group, event.group));
            state_.current_group = event.group;
        }
        return;
    }

    auto was_bound = registry_.bound_window();
    auto change = tracker_.apply(event);

    if (!was_bound) {
        if (auto bound = registry_.bound_window()) {
            log(std::format("bound to window 0x{:x}", *bound));
        }
    }

    switch (change) {
        case FocusChange::Gained:
            log(std::format("focus: 0x{:x}{}", event.window,
                            registry_.is_match(event.window) ? " (target)" : ""));
            break;
        case FocusChange::Lost:
            log(std::format("focus lost: 0x{:x} ({})", event.window, to_string(event.kind)));
            break;
        case FocusChange::None:
            break;
    }
}

std::expected<void, std::string> DaemonCore::evaluate() {
    auto decision = switcher_.evaluate(tracker_.focused(), registry_);
    if (!decision) return std::unexpected(decision.error());

    if (decision->changed) {
        log(std::format("switched to group {}", decision->group));
    }
    return {};
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[mimic] {}", msg);
    }
}

#include "window/window_registry.hpp"

#include <algorithm>
#include <utility>

WindowRegistry::WindowRegistry(Selector selector) : selector_(std::move(selector)) {}

void WindowRegistry::upsert(WindowHandle handle, const WindowProperties& props) {
    auto [it, inserted] = windows_.try_emplace(handle);
    auto& record = it->second;
    if (inserted) record.handle = handle;

    if (props.window_class) record.window_class = props.window_class;
    if (props.title) record.title = props.title;
    if (props.pid) record.pid = props.pid;

    refresh_target(record);
}

void WindowRegistry::upsert(WindowHandle handle, std::optional<std::string> window_class) {
    WindowProperties props;
    props.window_class = std::move(window_class);
    upsert(handle, props);
}

bool WindowRegistry::remove(WindowHandle handle) {
    auto it = windows_.find(handle);
    if (it == windows_.end()) return false;

    bool was_focused = it->second.is_focused;
    windows_.erase(it);
    // The handle may be reused by an unrelated window.
    if (bound_ && *bound_ == handle) binding_spent_ = true;
    if (was_focused) focused_.reset();
    return was_focused;
}

std::optional<WindowRecord> WindowRegistry::lookup(WindowHandle handle) const {
    auto it = windows_.find(handle);
    if (it == windows_.end()) return std::nullopt;
    return it->second;
}

bool WindowRegistry::is_match(WindowHandle handle) const {
    if (selector_.criterion() == Selector::Criterion::Id) {
        WindowRecord candidate;
        candidate.handle = handle;
        return selector_.matches(candidate);
    }
    auto it = windows_.find(handle);
    return it != windows_.end() && it->second.is_target;
}

void WindowRegistry::focus(WindowHandle handle) {
    if (focused_ && *focused_ == handle) return;

    if (focused_) {
        auto prev = windows_.find(*focused_);
        if (prev != windows_.end()) prev->second.is_focused = false;
    }

    auto [it, inserted] = windows_.try_emplace(handle);
    if (inserted) {
        it->second.handle = handle;
        refresh_target(it->second);
    }
    it->second.is_focused = true;
    focused_ = handle;
}

bool WindowRegistry::unfocus(WindowHandle handle) {
    if (!focused_ || *focused_ != handle) return false;

    auto it = windows_.find(handle);
    if (it != windows_.end()) it->second.is_focused = false;
    focused_.reset();
    return true;
}

size_t WindowRegistry::target_count() const {
    return static_cast<size_t>(std::ranges::count_if(
        windows_, [](const auto& entry) { return entry.second.is_target; }));
}

void WindowRegistry::refresh_target(WindowRecord& record) {
    if (selector_.continuous() || selector_.criterion() == Selector::Criterion::Id) {
        record.is_target = selector_.matches(record);
        return;
    }

    // First-match binding
    if (!bound_ && selector_.matches(record)) {
        bound_ = record.handle;
    }
    record.is_target = bound_ && !binding_spent_ && *bound_ == record.handle;
}

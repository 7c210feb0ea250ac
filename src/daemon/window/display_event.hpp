#pragma once

#include "window/window_record.hpp"

#include <string_view>
#include <utility>

// Display server event, normalized by the platform backend.
struct DisplayEvent {
    enum class Kind {
        Created,          // window appeared (or found by the startup enumeration)
        Destroyed,
        PropertyChanged,  // class, title or pid changed
        FocusIn,
        FocusOut,
        GroupChanged,     // keyboard group lock changed (possibly by another client)
    };

    Kind kind = Kind::Created;
    WindowHandle window = 0;
    WindowProperties properties;  // Created / PropertyChanged
    int group = 0;                // GroupChanged

    static DisplayEvent created(WindowHandle w, WindowProperties props = {}) {
        return {Kind::Created, w, std::move(props), 0};
    }
    static DisplayEvent destroyed(WindowHandle w) { return {Kind::Destroyed, w, {}, 0}; }
    static DisplayEvent property_changed(WindowHandle w, WindowProperties props) {
        return {Kind::PropertyChanged, w, std::move(props), 0};
    }
    static DisplayEvent focus_in(WindowHandle w) { return {Kind::FocusIn, w, {}, 0}; }
    static DisplayEvent focus_out(WindowHandle w) { return {Kind::FocusOut, w, {}, 0}; }
    static DisplayEvent group_changed(int group) { return {Kind::GroupChanged, 0, {}, group}; }
};

constexpr std::string_view to_string(DisplayEvent::Kind kind) {
    switch (kind) {
        case DisplayEvent::Kind::Created: return "created";
        case DisplayEvent::Kind::Destroyed: return "destroyed";
        case DisplayEvent::Kind::PropertyChanged: return "property-changed";
        case DisplayEvent::Kind::FocusIn: return "focus-in";
        case DisplayEvent::Kind::FocusOut: return "focus-out";
        case DisplayEvent::Kind::GroupChanged: return "group-changed";
    }
    return "unknown";
}

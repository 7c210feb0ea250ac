#pragma once

#include <X11/XKBlib.h>

#include <optional>

// New locked group carried by an XKB state notification. Latches and base
// group changes leave the lock, which is what XkbLockGroup sets, untouched.
inline std::optional<int> locked_group_change(const XkbStateNotifyEvent& ev) {
    if (ev.xkb_type != XkbStateNotify || !(ev.changed & XkbGroupLockMask)) return std::nullopt;
    return ev.locked_group;
}

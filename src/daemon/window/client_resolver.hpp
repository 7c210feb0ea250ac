#pragma once

#include "window/window_record.hpp"

#include <functional>
#include <optional>
#include <unordered_map>

// Maps a window that received the input focus to the client window it belongs
// to. Some toolkits (Java AWT, Tk) focus an unnamed child of their top-level
// window; the client is the nearest ancestor carrying WM_CLASS, or failing
// that the ancestor directly below the root (the WM frame).
class ClientResolver {
public:
    // Parent of a window, nullopt if it is gone.
    using ParentQuery = std::function<std::optional<WindowHandle>(WindowHandle)>;
    using ClientCheck = std::function<bool(WindowHandle)>;

    ClientResolver(WindowHandle root, ParentQuery parent_of, ClientCheck is_client);

    WindowHandle resolve(WindowHandle window);

    // Drops the cached parent link (window destroyed or reparented).
    void forget(WindowHandle window);

    void set_root(WindowHandle root) { root_ = root; }

private:
    std::optional<WindowHandle> parent(WindowHandle window);

    WindowHandle root_;
    ParentQuery parent_of_;
    ClientCheck is_client_;
    std::unordered_map<WindowHandle, WindowHandle> parents_;
};

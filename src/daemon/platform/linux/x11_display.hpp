#pragma once

#include "platform/display_server.hpp"
#include "window/client_resolver.hpp"

#include <X11/Xlib.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

struct DisplayDeleter {
    void operator()(Display* display) const {
        if (display) XCloseDisplay(display);
    }
};

using DisplayPtr = std::unique_ptr<Display, DisplayDeleter>;

// Xlib event source. Every window in the tree is watched for focus, property
// and substructure changes, so clients reparented into WM frames are seen too.
class X11Display : public DisplayServer {
public:
    explicit X11Display(bool verbose = false);
    ~X11Display() override;

    X11Display(const X11Display&) = delete;
    X11Display& operator=(const X11Display&) = delete;

    bool connect(const std::string& display_name) override;
    bool subscribe_window_events() override;
    std::vector<DisplayEvent> enumerate_windows() override;
    std::optional<WindowHandle> get_focused_window() override;
    int event_fd() const override;
    bool has_queued_events() override;
    std::expected<std::vector<DisplayEvent>, std::string> read_events() override;

    Display* display() const { return display_.get(); }

private:
    void watch_window(Window window);
    std::optional<WindowHandle> query_parent(Window window);
    void walk_tree(Window parent, std::vector<DisplayEvent>& out);

    std::optional<DisplayEvent> translate(const XEvent& event);
    std::optional<DisplayEvent> translate_property(const XPropertyEvent& event);

    WindowProperties fetch_properties(Window window);
    std::optional<std::string> fetch_class(Window window);
    std::optional<std::string> fetch_title(Window window);
    std::optional<int> fetch_pid(Window window);
    std::optional<std::string> fetch_string(Window window, Atom property, Atom type);

    void log(const std::string& msg);

    bool verbose_;
    DisplayPtr display_;
    Window root_ = 0;
    int xkb_event_base_ = -1;
    ClientResolver clients_;

    Atom net_wm_name_ = 0;
    Atom net_wm_pid_ = 0;
    Atom utf8_string_ = 0;
};

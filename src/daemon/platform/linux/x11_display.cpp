#include "platform/linux/x11_display.hpp"

#include "platform/linux/x11_error_trap.hpp"
#include "platform/linux/xkb_state.hpp"

#include <X11/XKBlib.h>
#include <X11/Xatom.h>
#include <X11/Xutil.h>

#include <format>
#include <print>
#include <utility>

namespace {

struct XFreeDeleter {
    void operator()(void* data) const {
        if (data) XFree(data);
    }
};

using XData = std::unique_ptr<unsigned char, XFreeDeleter>;

constexpr long kWindowEvents = FocusChangeMask | PropertyChangeMask | SubstructureNotifyMask;

// Only the window that actually gains or loses the input focus counts.
// Virtual/pointer details go to ancestors and the pointer window, and
// grab/ungrab pairs come from WM key bindings.
bool is_real_focus_change(const XFocusChangeEvent& ev) {
    if (ev.mode != NotifyNormal && ev.mode != NotifyWhileGrabbed) return false;
    return ev.detail == NotifyAncestor || ev.detail == NotifyInferior ||
           ev.detail == NotifyNonlinear;
}

} // namespace

X11Display::X11Display(bool verbose)
    : verbose_(verbose),
      clients_(None, [this](WindowHandle w) { return query_parent(w); },
               [this](WindowHandle w) { return fetch_class(w).has_value(); }) {}

X11Display::~X11Display() = default;

bool X11Display::connect(const std::string& display_name) {
    Display* raw = XOpenDisplay(display_name.empty() ? nullptr : display_name.c_str());
    if (!raw) {
        const char* name = display_name.empty() ? XDisplayName(nullptr) : display_name.c_str();
        std::println(stderr, "x11: cannot open display '{}'", name ? name : "");
        return false;
    }
    display_ = DisplayPtr(raw);
    install_x11_error_handlers(verbose_);

    int opcode = 0, error_base = 0;
    int major = XkbMajorVersion, minor = XkbMinorVersion;
    if (!XkbQueryExtension(display(), &opcode, &xkb_event_base_, &error_base, &major, &minor)) {
        std::println(stderr, "x11: XKB extension not available (server {}.{})", major, minor);
        xkb_event_base_ = -1;
        return false;
    }

    root_ = DefaultRootWindow(display());
    clients_.set_root(root_);
    net_wm_name_ = XInternAtom(display(), "_NET_WM_NAME", False);
    net_wm_pid_ = XInternAtom(display(), "_NET_WM_PID", False);
    utf8_string_ = XInternAtom(display(), "UTF8_STRING", False);

    log(std::format("connected to {}", XDisplayString(display())));
    return true;
}

bool X11Display::subscribe_window_events() {
    if (!display_) return false;

    XSelectInput(display(), root_, SubstructureNotifyMask | FocusChangeMask);

    if (!XkbSelectEventDetails(display(), XkbUseCoreKbd, XkbStateNotify,
                               XkbGroupLockMask, XkbGroupLockMask)) {
        std::println(stderr, "x11: cannot select XKB state events");
        return false;
    }

    XFlush(display());
    return true;
}

std::vector<DisplayEvent> X11Display::enumerate_windows() {
    std::vector<DisplayEvent> out;
    if (!display_) return out;
    walk_tree(root_, out);
    return out;
}

std::optional<WindowHandle> X11Display::get_focused_window() {
    if (!display_) return std::nullopt;

    Window focus = None;
    int revert_to = 0;
    XGetInputFocus(display(), &focus, &revert_to);
    if (focus == None || focus == PointerRoot) return std::nullopt;
    return clients_.resolve(focus);
}

int X11Display::event_fd() const {
    return display_ ? ConnectionNumber(display_.get()) : -1;
}

bool X11Display::has_queued_events() {
    return display_ && XEventsQueued(display(), QueuedAlready) > 0;
}

std::expected<std::vector<DisplayEvent>, std::string> X11Display::read_events() {
    if (!display_) return std::unexpected("not connected");

    std::vector<DisplayEvent> out;
    bool created = false;

    while (XPending(display()) > 0) {
        XEvent event;
        XNextEvent(display(), &event);
        if (auto ev = translate(event)) {
            created = created || ev->kind == DisplayEvent::Kind::Created;
            out.push_back(std::move(*ev));
        }
    }

    // A window may have been focused before we selected its focus events.
    if (created) {
        if (auto focus = get_focused_window()) {
            out.push_back(DisplayEvent::focus_in(*focus));
        }
    }
    return out;
}

void X11Display::watch_window(Window window) {
    XSelectInput(display(), window, kWindowEvents);
}

std::optional<WindowHandle> X11Display::query_parent(Window window) {
    Window root_ret = None, parent_ret = None;
    Window* children = nullptr;
    unsigned int count = 0;
    if (!XQueryTree(display(), window, &root_ret, &parent_ret, &children, &count)) {
        return std::nullopt;
    }
    if (children) XFree(children);
    if (parent_ret == None) return std::nullopt;
    return parent_ret;
}

void X11Display::walk_tree(Window parent, std::vector<DisplayEvent>& out) {
    Window root_ret = None, parent_ret = None;
    Window* children = nullptr;
    unsigned int count = 0;
    if (!XQueryTree(display(), parent, &root_ret, &parent_ret, &children, &count)) return;

    std::vector<Window> windows(children, children + count);
    XFree(children);

    for (Window w : windows) {
        XWindowAttributes attrs;
        if (!XGetWindowAttributes(display(), w, &attrs)) continue;  // already gone
        if (attrs.override_redirect) continue;

        watch_window(w);
        out.push_back(DisplayEvent::created(w, fetch_properties(w)));
        walk_tree(w, out);
    }
}

std::optional<DisplayEvent> X11Display::translate(const XEvent& event) {
    if (xkb_event_base_ >= 0 && event.type == xkb_event_base_) {
        const auto* xkb = reinterpret_cast<const XkbEvent*>(&event);
        if (xkb->any.xkb_type != XkbStateNotify) return std::nullopt;
        if (auto locked = locked_group_change(xkb->state)) {
            return DisplayEvent::group_changed(*locked);
        }
        return std::nullopt;
    }

    switch (event.type) {
        case CreateNotify: {
            const auto& ev = event.xcreatewindow;
            if (ev.override_redirect) return std::nullopt;
            watch_window(ev.window);
            return DisplayEvent::created(ev.window, fetch_properties(ev.window));
        }
        case DestroyNotify:
            clients_.forget(event.xdestroywindow.window);
            return DisplayEvent::destroyed(event.xdestroywindow.window);
        case ReparentNotify:
            clients_.forget(event.xreparent.window);
            return std::nullopt;
        case PropertyNotify:
            return translate_property(event.xproperty);
        case FocusIn:
            if (!is_real_focus_change(event.xfocus)) return std::nullopt;
            return DisplayEvent::focus_in(clients_.resolve(event.xfocus.window));
        case FocusOut:
            if (!is_real_focus_change(event.xfocus)) return std::nullopt;
            return DisplayEvent::focus_out(clients_.resolve(event.xfocus.window));
        default:
            return std::nullopt;
    }
}

std::optional<DisplayEvent> X11Display::translate_property(const XPropertyEvent& ev) {
    bool deleted = ev.state == PropertyDelete;
    WindowProperties props;

    if (ev.atom == XA_WM_CLASS) {
        props.window_class = deleted ? std::string() : fetch_class(ev.window);
    } else if (ev.atom == net_wm_name_ || ev.atom == XA_WM_NAME) {
        // Either name may remain after the other is deleted.
        props.title = fetch_title(ev.window);
        if (!props.title && deleted) props.title = std::string();
    } else if (ev.atom == net_wm_pid_ && !deleted) {
        props.pid = fetch_pid(ev.window);
    } else {
        return std::nullopt;
    }

    if (props.empty()) return std::nullopt;
    return DisplayEvent::property_changed(ev.window, std::move(props));
}

WindowProperties X11Display::fetch_properties(Window window) {
    WindowProperties props;
    props.window_class = fetch_class(window);
    props.title = fetch_title(window);
    props.pid = fetch_pid(window);
    return props;
}

std::optional<std::string> X11Display::fetch_class(Window window) {
    XClassHint hint{};
    if (!XGetClassHint(display(), window, &hint)) return std::nullopt;

    std::string instance = hint.res_name ? hint.res_name : "";
    std::string cls = hint.res_class ? hint.res_class : "";
    if (hint.res_name) XFree(hint.res_name);
    if (hint.res_class) XFree(hint.res_class);

    if (instance.empty()) return cls;
    if (cls.empty()) return instance;
    return instance + "." + cls;
}

std::optional<std::string> X11Display::fetch_title(Window window) {
    if (auto title = fetch_string(window, net_wm_name_, utf8_string_)) return title;
    return fetch_string(window, XA_WM_NAME, AnyPropertyType);
}

std::optional<int> X11Display::fetch_pid(Window window) {
    Atom type = None;
    int format = 0;
    unsigned long items = 0, after = 0;
    unsigned char* raw = nullptr;
    if (XGetWindowProperty(display(), window, net_wm_pid_, 0, 1, False, XA_CARDINAL,
                           &type, &format, &items, &after, &raw) != Success) {
        return std::nullopt;
    }
    XData data(raw);
    if (!data || type != XA_CARDINAL || format != 32 || items < 1) return std::nullopt;

    // Format-32 properties are delivered as longs.
    return static_cast<int>(*reinterpret_cast<const unsigned long*>(data.get()));
}

std::optional<std::string> X11Display::fetch_string(Window window, Atom property, Atom type) {
    Atom actual = None;
    int format = 0;
    unsigned long items = 0, after = 0;
    unsigned char* raw = nullptr;
    if (XGetWindowProperty(display(), window, property, 0, 1024, False, type,
                           &actual, &format, &items, &after, &raw) != Success) {
        return std::nullopt;
    }
    XData data(raw);
    if (!data || actual == None || format != 8) return std::nullopt;
    return std::string(reinterpret_cast<const char*>(data.get()), items);
}

void X11Display::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[mimic] {}", msg);
    }
}

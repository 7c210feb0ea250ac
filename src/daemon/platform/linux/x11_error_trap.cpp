#include "platform/linux/x11_error_trap.hpp"

#include "exit_code.hpp"

#include <cstdlib>
#include <format>
#include <print>

namespace {

struct TrapState {
    bool active = false;
    unsigned char error_code = 0;
    unsigned char request_code = 0;
    unsigned long resource = 0;
};

TrapState g_trap;
bool g_verbose = false;

std::string error_text(Display* display, unsigned char code) {
    char buf[256] = {};
    XGetErrorText(display, code, buf, sizeof(buf));
    return buf;
}

int on_x_error(Display* display, XErrorEvent* error) {
    if (g_trap.active) {
        if (g_trap.error_code == 0) {
            g_trap.error_code = error->error_code;
            g_trap.request_code = error->request_code;
            g_trap.resource = error->resourceid;
        }
        return 0;
    }

    if (g_verbose) {
        std::println(stderr, "[mimic] X error ignored: {} (request {}, resource 0x{:x})",
                     error_text(display, error->error_code), static_cast<int>(error->request_code),
                     error->resourceid);
    }
    return 0;
}

int on_x_io_error(Display* /*display*/) {
    std::println(stderr, "X connection lost");
    std::exit(static_cast<int>(ExitCode::Connection));
}

} // namespace

void install_x11_error_handlers(bool verbose) {
    g_verbose = verbose;
    XSetErrorHandler(on_x_error);
    XSetIOErrorHandler(on_x_io_error);
}

X11ErrorTrap::X11ErrorTrap(Display* display) : display_(display) {
    // Earlier requests must not report into this trap.
    XSync(display_, False);
    g_trap = TrapState{.active = true};
}

X11ErrorTrap::~X11ErrorTrap() {
    g_trap.active = false;
}

std::optional<std::string> X11ErrorTrap::check() {
    XSync(display_, False);
    if (g_trap.error_code == 0) return std::nullopt;
    return std::format("{} (request {}, resource 0x{:x})",
                       error_text(display_, g_trap.error_code), static_cast<int>(g_trap.request_code),
                       g_trap.resource);
}

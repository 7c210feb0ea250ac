#pragma once

#include <X11/Xlib.h>

#include <optional>
#include <string>

// Process-wide Xlib error handlers. Protocol errors outside a trap (mostly
// BadWindow for windows that vanished mid-request) are absorbed and only
// logged in verbose mode. An I/O error means the server is gone; Xlib does not
// let the handler return, so it exits with the connection-error code.
void install_x11_error_handlers(bool verbose);

// Captures the first protocol error raised by requests issued while it is
// alive. Not reentrant.
class X11ErrorTrap {
public:
    explicit X11ErrorTrap(Display* display);
    ~X11ErrorTrap();

    X11ErrorTrap(const X11ErrorTrap&) = delete;
    X11ErrorTrap& operator=(const X11ErrorTrap&) = delete;

    // Round-trips to the server and returns the captured error, if any.
    std::optional<std::string> check();

private:
    Display* display_;
};

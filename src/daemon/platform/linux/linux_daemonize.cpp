#include "platform/daemonizer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <print>
#include <unistd.h>

namespace platform {

bool daemonize() {
    pid_t pid = fork();
    if (pid < 0) {
        std::println(stderr, "fork() failed: {}", std::strerror(errno));
        return false;
    }
    // _exit: the parent must not close the inherited X connection
    if (pid > 0) _exit(0);

    setsid();

    // Second fork so the session leader cannot reacquire a terminal
    pid = fork();
    if (pid < 0) _exit(1);
    if (pid > 0) _exit(0);

    if (!freopen("/dev/null", "r", stdin) || !freopen("/dev/null", "w", stdout) ||
        !freopen("/dev/null", "w", stderr)) {
        return false;
    }
    return true;
}

} // namespace platform

#pragma once

#include "config.hpp"
#include "daemon_core.hpp"
#include "exit_code.hpp"
#include "platform/display_server.hpp"
#include "platform/keyboard_group.hpp"
#include "window/selector.hpp"

#include <atomic>
#include <optional>
#include <string>

class LinuxEventLoop {
public:
    LinuxEventLoop(Config config, Selector selector, DisplayServer& display,
                   KeyboardGroup& keyboard, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    ExitCode init();
    // Runs until a signal or a fatal error; the default group is restored
    // before returning whenever the display is still reachable.
    ExitCode run();
    void request_stop();

private:
    void process_display_events();
    void fail(ExitCode code, const std::string& msg);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    DisplayServer& display_;
    KeyboardGroup& keyboard_;

    // Built once the display is connected
    std::optional<Selector> selector_;
    std::optional<DaemonCore> core_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;

    std::atomic<bool> running_{false};
    ExitCode exit_code_ = ExitCode::Ok;
};

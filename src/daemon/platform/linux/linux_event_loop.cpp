#include "platform/linux/linux_event_loop.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/signalfd.h>
#include <unistd.h>
#include <utility>

LinuxEventLoop::LinuxEventLoop(Config config, Selector selector, DisplayServer& display,
                               KeyboardGroup& keyboard, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      display_(display), keyboard_(keyboard),
      selector_(std::move(selector)) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
}

ExitCode LinuxEventLoop::init() {
    // Signals first, so a SIGTERM during startup still goes through the
    // restore path instead of killing the process with the override active.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigaddset(&mask, SIGHUP);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return ExitCode::Connection;
    }

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return ExitCode::Connection;
    }

    // Display
    if (!display_.connect(config_.display)) return ExitCode::Connection;
    if (!display_.subscribe_window_events()) return ExitCode::Connection;

    auto windows = display_.enumerate_windows();
    auto focused = display_.get_focused_window();

    core_.emplace(config_, std::move(*selector_), keyboard_, verbose_);
    selector_.reset();
    if (auto code = core_->init(windows, focused); code != ExitCode::Ok) {
        return code;
    }

    // Register FDs with epoll
    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    if (!add_fd(signal_fd_, EPOLLIN) || !add_fd(display_.event_fd(), EPOLLIN)) {
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        core_->shutdown();
        return ExitCode::Connection;
    }

    running_.store(true, std::memory_order_release);
    return ExitCode::Ok;
}

ExitCode LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 4;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        // Round trips can leave events in the client-side queue without the
        // socket becoming readable again.
        if (display_.has_queued_events()) {
            process_display_events();
            continue;
        }

        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            fail(ExitCode::Connection, std::format("epoll_wait error: {}", std::strerror(errno)));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) == sizeof(info)) {
                    log(std::format("Received signal {}, shutting down", info.ssi_signo));
                }
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == display_.event_fd()) {
                if (events[i].events & (EPOLLHUP | EPOLLERR)) {
                    fail(ExitCode::Connection, "display connection closed");
                    break;
                }
                process_display_events();
            }
        }
    }

    // The override cannot be released over a dead connection.
    if (core_ && exit_code_ != ExitCode::Connection) {
        core_->shutdown();
    }
    return exit_code_;
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::process_display_events() {
    auto batch = display_.read_events();
    if (!batch) {
        fail(ExitCode::Connection, "display read failed: " + batch.error());
        return;
    }
    if (batch->empty()) return;

    if (auto res = core_->handle_batch(*batch); !res) {
        fail(ExitCode::GroupRejected, res.error());
    }
}

void LinuxEventLoop::fail(ExitCode code, const std::string& msg) {
    std::println(stderr, "{}", msg);
    exit_code_ = code;
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[mimic] {}", msg);
    }
}

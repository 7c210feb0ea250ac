#include "cli.hpp"
#include "config.hpp"
#include "exit_code.hpp"
#include "platform/daemonizer.hpp"
#include "platform/linux/linux_event_loop.hpp"
#include "platform/linux/x11_display.hpp"
#include "platform/linux/xkb_keyboard.hpp"

#include <print>
#include <utility>

int main(int argc, char* argv[]) {
    auto opts = parse_cli(argc, argv);
    if (!opts) {
        std::println(stderr, "mimic: {}", opts.error());
        std::println(stderr, "Try '{} --help' for more information.", argv[0]);
        return static_cast<int>(ExitCode::Config);
    }
    if (opts->help) {
        print_usage(argv[0]);
        return 0;
    }

    // Load config, command line wins
    Config config = opts->config_path ? Config::load(*opts->config_path) : Config::load_default();
    apply_cli(*opts, config);

    auto selector = config.make_selector();
    if (!selector) {
        std::println(stderr, "mimic: {}", selector.error());
        return static_cast<int>(ExitCode::Config);
    }

    bool verbose = config.verbose;
    X11Display display(verbose);
    XkbKeyboard keyboard(display);

    LinuxEventLoop loop(std::move(config), std::move(*selector), display, keyboard, verbose);
    if (auto code = loop.init(); code != ExitCode::Ok) {
        return static_cast<int>(code);
    }

    // Detach only after startup errors had a chance to reach the terminal
    if (opts->daemon && !platform::daemonize()) {
        loop.request_stop();
        loop.run();
        return static_cast<int>(ExitCode::Config);
    }

    return static_cast<int>(loop.run());
}

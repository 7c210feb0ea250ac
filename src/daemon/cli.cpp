#include "cli.hpp"

#include <format>
#include <print>
#include <string_view>

std::expected<CliOptions, std::string> parse_cli(int argc, const char* const argv[]) {
    CliOptions opts;

    for (int i = 1; i < argc; i++) {
        std::string_view arg = argv[i];

        auto value = [&]() -> std::expected<std::string_view, std::string> {
            if (i + 1 >= argc) return std::unexpected(std::format("{} requires a value", arg));
            return std::string_view(argv[++i]);
        };
        auto index = [&]() -> std::expected<int, std::string> {
            auto v = value();
            if (!v) return std::unexpected(v.error());
            auto n = parse_index(*v);
            if (!n) return std::unexpected(std::format("{}: invalid layout index '{}'", arg, *v));
            return *n;
        };

        if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--daemon" || arg == "-d") {
            opts.daemon = true;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--all" || arg == "-a") {
            opts.all = true;
        } else if (arg == "--exact") {
            opts.exact = true;
        } else if (arg == "--ignore-case" || arg == "-i") {
            opts.ignore_case = true;
        } else if (arg == "--window" || arg == "-w") {
            auto v = value();
            if (!v) return std::unexpected(v.error());
            opts.window = parse_window_id(*v);
            if (!opts.window) return std::unexpected(std::format("invalid window id '{}'", *v));
        } else if (arg == "--class" || arg == "-c") {
            auto v = value();
            if (!v) return std::unexpected(v.error());
            opts.window_class = std::string(*v);
        } else if (arg == "--name" || arg == "-n") {
            auto v = value();
            if (!v) return std::unexpected(v.error());
            opts.name = std::string(*v);
        } else if (arg == "--pid" || arg == "-p") {
            auto v = value();
            if (!v) return std::unexpected(v.error());
            opts.pid = parse_index(*v);
            if (!opts.pid) return std::unexpected(std::format("invalid pid '{}'", *v));
        } else if (arg == "--layout" || arg == "-l") {
            auto n = index();
            if (!n) return std::unexpected(n.error());
            opts.layout = *n;
        } else if (arg == "--default-layout") {
            auto n = index();
            if (!n) return std::unexpected(n.error());
            opts.default_layout = *n;
        } else if (arg == "--display") {
            auto v = value();
            if (!v) return std::unexpected(v.error());
            opts.display = std::string(*v);
        } else if (arg == "--config") {
            auto v = value();
            if (!v) return std::unexpected(v.error());
            opts.config_path = std::string(*v);
        } else {
            return std::unexpected(std::format("unknown option '{}'", arg));
        }
    }

    return opts;
}

void apply_cli(const CliOptions& opts, Config& config) {
    if (opts.window || opts.window_class || opts.name || opts.pid) {
        config.selection = Config::Selection{
            .window = opts.window,
            .window_class = opts.window_class,
            .name = opts.name,
            .pid = opts.pid,
            .all = opts.all,
        };
    } else if (opts.all) {
        config.selection.all = true;
    }

    if (opts.layout) config.layout.target = *opts.layout;
    if (opts.default_layout) config.layout.default_group = *opts.default_layout;
    if (opts.exact) config.match.exact = true;
    if (opts.ignore_case) config.match.case_sensitive = false;
    if (opts.display) config.display = *opts.display;
    if (opts.verbose) config.verbose = true;
}

void print_usage(const char* prog) {
    std::println("Usage: {} [options]", prog);
    std::println("Use a different keyboard layout group while selected windows have focus.");
    std::println("Set up the layouts first, e.g.: setxkbmap -layout dvorak,us");
    std::println("");
    std::println("Selection (exactly one):");
    std::println("  -w, --window ID          Window id (decimal or 0x hex, see xwininfo)");
    std::println("  -c, --class PATTERN      WM_CLASS as \"instance.class\", e.g. discord.discord");
    std::println("  -n, --name PATTERN       Window title (_NET_WM_NAME / WM_NAME)");
    std::println("  -p, --pid PID            Client process id (_NET_WM_PID)");
    std::println("  -a, --all                Match every current and future window (not with --window)");
    std::println("");
    std::println("Layout:");
    std::println("  -l, --layout INDEX       Group for selected windows (default 1)");
    std::println("      --default-layout N   Group for all other windows (default 0)");
    std::println("");
    std::println("Matching:");
    std::println("      --exact              Whole-string match instead of substring");
    std::println("  -i, --ignore-case        Case-insensitive match");
    std::println("");
    std::println("General:");
    std::println("      --display NAME       X display (default $DISPLAY)");
    std::println("      --config PATH        Config file path");
    std::println("  -d, --daemon             Detach from the terminal");
    std::println("  -v, --verbose            Enable verbose logging");
    std::println("  -h, --help               Show this help");
}

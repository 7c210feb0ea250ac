#include <catch2/catch_test_macros.hpp>

#include "cli.hpp"
#include "exit_code.hpp"

#include <initializer_list>
#include <vector>

namespace {

std::expected<CliOptions, std::string> parse(std::initializer_list<const char*> args) {
    std::vector<const char*> argv = {"mimic"};
    argv.insert(argv.end(), args.begin(), args.end());
    return parse_cli(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST_CASE("parse_cli", "[cli]") {

    SECTION("NoArguments") {
        auto opts = parse({});
        REQUIRE(opts);
        REQUIRE_FALSE(opts->help);
        REQUIRE_FALSE(opts->layout);
    }

    SECTION("WindowAndLayout") {
        auto opts = parse({"--window", "123456", "--layout", "1"});
        REQUIRE(opts);
        REQUIRE(opts->window == 123456);
        REQUIRE(opts->layout == 1);
    }

    SECTION("ShortFlags") {
        auto opts = parse({"-c", "discord.discord", "-l", "2", "-a", "-i", "-v", "-d"});
        REQUIRE(opts);
        REQUIRE(opts->window_class == "discord.discord");
        REQUIRE(opts->layout == 2);
        REQUIRE(opts->all);
        REQUIRE(opts->ignore_case);
        REQUIRE(opts->verbose);
        REQUIRE(opts->daemon);
    }

    SECTION("HexWindowId") {
        auto opts = parse({"-w", "0x1e00003"});
        REQUIRE(opts);
        REQUIRE(opts->window == 0x1e00003);
    }

    SECTION("Help") {
        auto opts = parse({"--help"});
        REQUIRE(opts);
        REQUIRE(opts->help);
    }

    SECTION("UnknownOption") {
        auto opts = parse({"--frobnicate"});
        REQUIRE_FALSE(opts);
        REQUIRE(opts.error() == "unknown option '--frobnicate'");
    }

    SECTION("MissingValue") {
        auto opts = parse({"--class"});
        REQUIRE_FALSE(opts);
        REQUIRE(opts.error() == "--class requires a value");
    }

    SECTION("InvalidLayoutIndex") {
        auto opts = parse({"--layout", "-1"});
        REQUIRE_FALSE(opts);
        REQUIRE(opts.error() == "--layout: invalid layout index '-1'");
    }

    SECTION("InvalidWindowId") {
        REQUIRE_FALSE(parse({"--window", "zzz"}));
        REQUIRE_FALSE(parse({"--pid", "abc"}));
    }
}

TEST_CASE("apply_cli", "[cli]") {
    Config cfg;
    cfg.selection.window_class = "kitty";
    cfg.selection.all = true;
    cfg.layout.target = 2;

    SECTION("CliSelectionReplacesFileSelection") {
        auto opts = parse({"--window", "42"});
        REQUIRE(opts);
        apply_cli(*opts, cfg);
        REQUIRE(cfg.selection.window == 42);
        REQUIRE_FALSE(cfg.selection.window_class);
        REQUIRE_FALSE(cfg.selection.all);
        REQUIRE(cfg.make_selector());
    }

    SECTION("UnsetFlagsKeepFileValues") {
        auto opts = parse({"-v"});
        REQUIRE(opts);
        apply_cli(*opts, cfg);
        REQUIRE(cfg.selection.window_class == "kitty");
        REQUIRE(cfg.selection.all);
        REQUIRE(cfg.layout.target == 2);
        REQUIRE(cfg.verbose);
    }

    SECTION("LayoutAndMatchOverrides") {
        auto opts = parse({"--layout", "1", "--default-layout", "2", "--exact", "-i", "--display", ":3"});
        REQUIRE(opts);
        apply_cli(*opts, cfg);
        REQUIRE(cfg.layout.target == 1);
        REQUIRE(cfg.layout.default_group == 2);
        REQUIRE(cfg.match.exact);
        REQUIRE_FALSE(cfg.match.case_sensitive);
        REQUIRE(cfg.display == ":3");
    }

    SECTION("AllAloneExtendsFileSelection") {
        cfg.selection.all = false;
        auto opts = parse({"--all"});
        REQUIRE(opts);
        apply_cli(*opts, cfg);
        REQUIRE(cfg.selection.window_class == "kitty");
        REQUIRE(cfg.selection.all);
    }
}

TEST_CASE("ExitCode", "[cli]") {
    // Documented process exit statuses
    REQUIRE(static_cast<int>(ExitCode::Ok) == 0);
    REQUIRE(static_cast<int>(ExitCode::Config) == 1);
    REQUIRE(static_cast<int>(ExitCode::Connection) == 2);
    REQUIRE(static_cast<int>(ExitCode::GroupRejected) == 3);
}

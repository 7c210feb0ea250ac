#pragma once

#include "config.hpp"

#include <expected>
#include <optional>
#include <string>

// Command-line flags. Unset fields leave the config file's value alone.
struct CliOptions {
    bool help = false;
    bool daemon = false;
    bool verbose = false;
    std::optional<std::string> config_path;
    std::optional<std::string> display;

    std::optional<WindowHandle> window;
    std::optional<std::string> window_class;
    std::optional<std::string> name;
    std::optional<int> pid;
    bool all = false;

    std::optional<int> layout;
    std::optional<int> default_layout;
    bool exact = false;
    bool ignore_case = false;
};

std::expected<CliOptions, std::string> parse_cli(int argc, const char* const argv[]);

// A selection given on the command line replaces the file's selection.
void apply_cli(const CliOptions& opts, Config& config);

void print_usage(const char* prog);

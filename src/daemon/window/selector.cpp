#include "window/selector.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <utility>

namespace {

bool chars_equal(char a, char b, bool case_sensitive) {
    if (case_sensitive) return a == b;
    return std::tolower(static_cast<unsigned char>(a)) ==
           std::tolower(static_cast<unsigned char>(b));
}

} // namespace

bool match_text(std::string_view text, std::string_view pattern, const MatchOptions& opts) {
    if (pattern.empty()) return false;

    auto eq = [&](char a, char b) { return chars_equal(a, b, opts.case_sensitive); };

    if (opts.exact) {
        return std::ranges::equal(text, pattern, eq);
    }
    return !std::ranges::search(text, pattern, eq).empty();
}

Selector Selector::by_id(WindowHandle window) {
    Selector s(Criterion::Id, false);
    s.window_ = window;
    return s;
}

Selector Selector::by_class(std::string pattern, bool all, MatchOptions opts) {
    Selector s(Criterion::Class, all);
    s.pattern_ = std::move(pattern);
    s.opts_ = opts;
    return s;
}

Selector Selector::by_name(std::string pattern, bool all, MatchOptions opts) {
    Selector s(Criterion::Name, all);
    s.pattern_ = std::move(pattern);
    s.opts_ = opts;
    return s;
}

Selector Selector::by_pid(int pid, bool all) {
    Selector s(Criterion::Pid, all);
    s.pid_ = pid;
    return s;
}

bool Selector::matches(const WindowRecord& record) const {
    switch (criterion_) {
        case Criterion::Id:
            return record.handle == window_;
        case Criterion::Class:
            return record.window_class && match_text(*record.window_class, pattern_, opts_);
        case Criterion::Name:
            return record.title && match_text(*record.title, pattern_, opts_);
        case Criterion::Pid:
            return record.pid && *record.pid == pid_;
    }
    return false;
}

std::string Selector::describe() const {
    std::string desc;
    switch (criterion_) {
        case Criterion::Id:
            return std::format("window 0x{:x}", window_);
        case Criterion::Class:
            desc = std::format("class \"{}\"", pattern_);
            break;
        case Criterion::Name:
            desc = std::format("name \"{}\"", pattern_);
            break;
        case Criterion::Pid:
            desc = std::format("pid {}", pid_);
            break;
    }
    if (criterion_ != Criterion::Pid) {
        desc += opts_.exact ? " (exact" : " (substring";
        desc += opts_.case_sensitive ? ")" : ", ignore case)";
    }
    if (all_) desc += " [all]";
    return desc;
}

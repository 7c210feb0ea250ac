#pragma once

#include "window/window_record.hpp"

#include <string>
#include <string_view>

struct MatchOptions {
    bool exact = false;          // equality instead of substring containment
    bool case_sensitive = true;
};

// True if `text` matches `pattern` under `opts`. An empty pattern never matches.
bool match_text(std::string_view text, std::string_view pattern, const MatchOptions& opts);

// Immutable predicate describing which windows get the target layout.
class Selector {
public:
    enum class Criterion { Id, Class, Name, Pid };

    static Selector by_id(WindowHandle window);
    static Selector by_class(std::string pattern, bool all, MatchOptions opts = {});
    static Selector by_name(std::string pattern, bool all, MatchOptions opts = {});
    static Selector by_pid(int pid, bool all);

    Criterion criterion() const { return criterion_; }

    // All-variants keep matching every present and future window. The others
    // settle on the first matching window (see WindowRegistry).
    bool continuous() const { return all_; }

    // Attribute predicate, ignoring first-match binding. For Id this is
    // handle equality and needs no attributes.
    bool matches(const WindowRecord& record) const;

    std::string describe() const;

private:
    Selector(Criterion criterion, bool all) : criterion_(criterion), all_(all) {}

    Criterion criterion_;
    bool all_;
    WindowHandle window_ = 0;
    int pid_ = 0;
    std::string pattern_;
    MatchOptions opts_;
};

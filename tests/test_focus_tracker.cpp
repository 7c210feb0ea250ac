#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "window/focus_tracker.hpp"

#include <cstddef>
#include <random>
#include <vector>

namespace {

size_t count_focused(const WindowRegistry& reg, const std::vector<WindowHandle>& handles) {
    size_t n = 0;
    for (auto h : handles) {
        if (auto rec = reg.lookup(h); rec && rec->is_focused) n++;
    }
    return n;
}

} // namespace

TEST_CASE("FocusTracker", "[focus]") {
    WindowRegistry reg(Selector::by_class("discord", true));
    FocusTracker tracker(reg);

    SECTION("CreateThenFocus") {
        REQUIRE(tracker.apply(DisplayEvent::created(1, with_class("discord.discord"))) ==
                FocusChange::None);
        REQUIRE(tracker.apply(DisplayEvent::focus_in(1)) == FocusChange::Gained);
        REQUIRE(tracker.focused() == 1);
        REQUIRE(reg.lookup(1)->is_focused);
    }

    SECTION("FocusMovesOutThenIn") {
        tracker.apply(DisplayEvent::created(1));
        tracker.apply(DisplayEvent::created(2));
        tracker.apply(DisplayEvent::focus_in(1));

        REQUIRE(tracker.apply(DisplayEvent::focus_out(1)) == FocusChange::Lost);
        REQUIRE_FALSE(tracker.focused());
        REQUIRE(tracker.apply(DisplayEvent::focus_in(2)) == FocusChange::Gained);
        REQUIRE(tracker.focused() == 2);
        REQUIRE_FALSE(reg.lookup(1)->is_focused);
    }

    SECTION("FocusOutOfOtherWindowIsIgnored") {
        tracker.apply(DisplayEvent::focus_in(1));
        REQUIRE(tracker.apply(DisplayEvent::focus_out(2)) == FocusChange::None);
        REQUIRE(tracker.focused() == 1);
    }

    SECTION("RepeatedFocusInIsNoChange") {
        tracker.apply(DisplayEvent::focus_in(1));
        REQUIRE(tracker.apply(DisplayEvent::focus_in(1)) == FocusChange::None);
    }

    SECTION("DestroyFocusedLosesFocus") {
        tracker.apply(DisplayEvent::created(1));
        tracker.apply(DisplayEvent::focus_in(1));
        REQUIRE(tracker.apply(DisplayEvent::destroyed(1)) == FocusChange::Lost);
        REQUIRE_FALSE(tracker.focused());
        REQUIRE_FALSE(reg.contains(1));
    }

    SECTION("DestroyUnknownIsNoop") {
        REQUIRE(tracker.apply(DisplayEvent::destroyed(5)) == FocusChange::None);
    }

    SECTION("PropertyChangeTurnsWindowIntoTarget") {
        tracker.apply(DisplayEvent::created(1));
        REQUIRE_FALSE(reg.is_match(1));
        tracker.apply(DisplayEvent::property_changed(1, with_class("discord.discord")));
        REQUIRE(reg.is_match(1));
    }

    SECTION("GroupChangeIsNotAWindowEvent") {
        REQUIRE(tracker.apply(DisplayEvent::group_changed(1)) == FocusChange::None);
        REQUIRE(reg.size() == 0);
    }

    SECTION("AtMostOneFocusedUnderRandomEvents") {
        std::mt19937 rng(1234);
        std::uniform_int_distribution<WindowHandle> pick(1, 6);
        std::uniform_int_distribution<int> kind(0, 3);
        std::vector<WindowHandle> handles = {1, 2, 3, 4, 5, 6};

        for (int i = 0; i < 2000; i++) {
            WindowHandle w = pick(rng);
            switch (kind(rng)) {
                case 0: tracker.apply(DisplayEvent::created(w)); break;
                case 1: tracker.apply(DisplayEvent::destroyed(w)); break;
                case 2: tracker.apply(DisplayEvent::focus_in(w)); break;
                case 3: tracker.apply(DisplayEvent::focus_out(w)); break;
            }
            REQUIRE(count_focused(reg, handles) <= 1);
            if (auto f = tracker.focused()) {
                REQUIRE(reg.lookup(*f)->is_focused);
            }
        }
    }
}

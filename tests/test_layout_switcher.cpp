#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "layout/layout_switcher.hpp"

TEST_CASE("LayoutSwitcher", "[switcher]") {
    FakeKeyboard kbd;
    SessionState state{.current_group = 0, .default_group = 0, .target_group = 1};
    LayoutSwitcher switcher(kbd, state);

    WindowRegistry reg(Selector::by_id(123456));
    reg.upsert(999, std::nullopt);

    SECTION("TargetFocusedSwitchesToTargetGroup") {
        auto d = switcher.evaluate(123456, reg);
        REQUIRE(d);
        REQUIRE(d->group == 1);
        REQUIRE(d->changed);
        REQUIRE(state.current_group == 1);
        REQUIRE(kbd.requests == std::vector<int>{1});
    }

    SECTION("RedundantRequestsAreSuppressed") {
        REQUIRE(switcher.evaluate(123456, reg));
        auto again = switcher.evaluate(123456, reg);
        REQUIRE(again);
        REQUIRE_FALSE(again->changed);
        REQUIRE(kbd.requests.size() == 1);
        REQUIRE(switcher.requests_issued() == 1);
    }

    SECTION("NonTargetAndNoFocusUseDefault") {
        REQUIRE(switcher.evaluate(123456, reg));
        auto d = switcher.evaluate(999, reg);
        REQUIRE(d);
        REQUIRE(d->group == 0);
        REQUIRE(state.current_group == 0);

        auto none = switcher.evaluate(std::nullopt, reg);
        REQUIRE(none);
        REQUIRE_FALSE(none->changed);
        REQUIRE(kbd.requests == std::vector<int>{1, 0});
    }

    SECTION("RejectedRequestKeepsCurrentGroup") {
        kbd.reject = true;
        auto d = switcher.evaluate(123456, reg);
        REQUIRE_FALSE(d);
        REQUIRE(state.current_group == 0);
        REQUIRE(kbd.requests.empty());
        REQUIRE(switcher.requests_issued() == 0);
    }

    SECTION("RestoreDefault") {
        REQUIRE(switcher.evaluate(123456, reg));
        auto r = switcher.restore_default();
        REQUIRE(r);
        REQUIRE(r->changed);
        REQUIRE(kbd.group == 0);

        auto again = switcher.restore_default();
        REQUIRE(again);
        REQUIRE_FALSE(again->changed);
    }

    SECTION("NonZeroDefaultGroup") {
        state.default_group = 2;
        auto d = switcher.evaluate(999, reg);
        REQUIRE(d);
        REQUIRE(d->group == 2);
        REQUIRE(kbd.group == 2);
    }
}

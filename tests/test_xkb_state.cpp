#include <catch2/catch_test_macros.hpp>

#include "platform/linux/xkb_state.hpp"

namespace {

XkbStateNotifyEvent state_notify(unsigned int changed, int group, int locked_group) {
    XkbStateNotifyEvent ev{};
    ev.xkb_type = XkbStateNotify;
    ev.changed = changed;
    ev.group = group;
    ev.locked_group = locked_group;
    return ev;
}

} // namespace

TEST_CASE("locked_group_change", "[xkb]") {

    SECTION("LockChangeReportsLockedGroup") {
        auto ev = state_notify(XkbGroupLockMask | XkbGroupStateMask, 1, 1);
        REQUIRE(locked_group_change(ev) == 1);
    }

    SECTION("LatchIsNotAGroupChange") {
        // Another client latched group 2 while group 0 stays locked
        auto ev = state_notify(XkbGroupLatchMask | XkbGroupStateMask, 2, 0);
        REQUIRE_FALSE(locked_group_change(ev));
    }

    SECTION("EffectiveGroupIsIgnored") {
        auto ev = state_notify(XkbGroupLockMask | XkbGroupStateMask, 2, 1);
        REQUIRE(locked_group_change(ev) == 1);
    }

    SECTION("OtherNotificationKinds") {
        auto ev = state_notify(XkbGroupLockMask, 1, 1);
        ev.xkb_type = XkbControlsNotify;
        REQUIRE_FALSE(locked_group_change(ev));
    }
}

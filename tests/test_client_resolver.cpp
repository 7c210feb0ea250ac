#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "daemon_core.hpp"
#include "window/client_resolver.hpp"

#include <map>
#include <set>

namespace {

constexpr WindowHandle kRoot = 0x100;

// root -> frame 0x200 -> client 0x300 (WM_CLASS) -> focus proxy 0x301 -> 0x302
struct FakeTree {
    std::map<WindowHandle, WindowHandle> parents = {
        {0x200, kRoot}, {0x300, 0x200}, {0x301, 0x300}, {0x302, 0x301}, {0x400, kRoot}};
    std::set<WindowHandle> clients = {0x300};
    int queries = 0;

    ClientResolver resolver() {
        return ClientResolver(
            kRoot,
            [this](WindowHandle w) -> std::optional<WindowHandle> {
                queries++;
                auto it = parents.find(w);
                if (it == parents.end()) return std::nullopt;
                return it->second;
            },
            [this](WindowHandle w) { return clients.contains(w); });
    }
};

} // namespace

TEST_CASE("ClientResolver", "[client_resolver]") {
    FakeTree tree;
    auto resolver = tree.resolver();

    SECTION("ClientResolvesToItself") {
        REQUIRE(resolver.resolve(0x300) == 0x300);
        REQUIRE(tree.queries == 0);
    }

    SECTION("FocusProxyResolvesToClient") {
        REQUIRE(resolver.resolve(0x301) == 0x300);
        REQUIRE(resolver.resolve(0x302) == 0x300);
    }

    SECTION("ParentLinksAreCached") {
        REQUIRE(resolver.resolve(0x302) == 0x300);
        int after_first = tree.queries;
        REQUIRE(resolver.resolve(0x302) == 0x300);
        REQUIRE(tree.queries == after_first);
    }

    SECTION("UnnamedTopLevelResolvesToChildOfRoot") {
        tree.clients.clear();
        REQUIRE(resolver.resolve(0x302) == 0x200);
        REQUIRE(resolver.resolve(0x400) == 0x400);
    }

    SECTION("VanishedWindowStaysAsIs") {
        REQUIRE(resolver.resolve(0x999) == 0x999);
    }

    SECTION("ForgetRequeriesAfterReparent") {
        REQUIRE(resolver.resolve(0x301) == 0x300);
        tree.parents[0x301] = 0x400;
        resolver.forget(0x301);
        tree.clients.insert(0x400);
        REQUIRE(resolver.resolve(0x301) == 0x400);
    }
}

TEST_CASE("Focus on a child of a target window", "[client_resolver]") {
    FakeTree tree;
    auto resolver = tree.resolver();
    FakeKeyboard kbd;

    Config cfg;
    cfg.layout.target = 1;
    DaemonCore core(cfg, Selector::by_class("jetbrains", true), kbd, false);
    REQUIRE(core.init({DisplayEvent::created(0x300, with_class("jetbrains-idea.jetbrains-idea")),
                       DisplayEvent::created(0x301), DisplayEvent::created(0x400, with_class("kitty.kitty"))},
                      0x400) == ExitCode::Ok);

    // The toolkit focuses its unnamed proxy child; the backend reports the client
    REQUIRE(core.handle_batch({DisplayEvent::focus_out(resolver.resolve(0x400)),
                               DisplayEvent::focus_in(resolver.resolve(0x301))}));
    REQUIRE(core.focused() == 0x300);
    REQUIRE(kbd.group == 1);
}

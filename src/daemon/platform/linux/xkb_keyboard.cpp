#include "platform/linux/xkb_keyboard.hpp"

#include "platform/linux/x11_error_trap.hpp"

#include <X11/XKBlib.h>

#include <format>
#include <memory>

namespace {

struct XkbDescDeleter {
    void operator()(XkbDescPtr desc) const {
        if (desc) XkbFreeKeyboard(desc, XkbAllComponentsMask, True);
    }
};

using XkbDescHandle = std::unique_ptr<XkbDescRec, XkbDescDeleter>;

} // namespace

XkbKeyboard::XkbKeyboard(X11Display& display) : display_(display) {}

std::expected<int, std::string> XkbKeyboard::current_group() {
    Display* dpy = display_.display();
    if (!dpy) return std::unexpected("not connected");

    XkbStateRec state{};
    if (XkbGetState(dpy, XkbUseCoreKbd, &state) != Success) {
        return std::unexpected("XkbGetState failed");
    }
    // The lock is what lock_group() sets; state.group also folds in latches.
    return static_cast<int>(state.locked_group);
}

int XkbKeyboard::group_count() {
    Display* dpy = display_.display();
    if (!dpy) return 0;

    XkbDescHandle desc(XkbAllocKeyboard());
    if (!desc) return 0;
    if (XkbGetControls(dpy, XkbGroupsWrapMask, desc.get()) != Success || !desc->ctrls) return 0;
    return desc->ctrls->num_groups;
}

std::vector<std::string> XkbKeyboard::group_names() {
    std::vector<std::string> names;
    Display* dpy = display_.display();
    if (!dpy) return names;

    XkbDescHandle desc(XkbAllocKeyboard());
    if (!desc) return names;
    if (XkbGetControls(dpy, XkbGroupsWrapMask, desc.get()) != Success || !desc->ctrls) return names;
    if (XkbGetNames(dpy, XkbGroupNamesMask, desc.get()) != Success || !desc->names) return names;

    for (int i = 0; i < desc->ctrls->num_groups && i < XkbNumKbdGroups; i++) {
        Atom atom = desc->names->groups[i];
        char* name = atom != None ? XGetAtomName(dpy, atom) : nullptr;
        names.emplace_back(name ? name : std::format("group {}", i));
        if (name) XFree(name);
    }
    return names;
}

std::expected<void, std::string> XkbKeyboard::lock_group(int group) {
    Display* dpy = display_.display();
    if (!dpy) return std::unexpected("not connected");

    X11ErrorTrap trap(dpy);
    if (!XkbLockGroup(dpy, XkbUseCoreKbd, static_cast<unsigned int>(group))) {
        return std::unexpected("XkbLockGroup request could not be sent");
    }
    if (auto err = trap.check()) {
        return std::unexpected(*err);
    }
    return {};
}

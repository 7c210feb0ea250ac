#pragma once

#include "platform/keyboard_group.hpp"
#include "platform/linux/x11_display.hpp"

// Core keyboard group state through the XKB extension, on the connection
// owned by X11Display.
class XkbKeyboard : public KeyboardGroup {
public:
    explicit XkbKeyboard(X11Display& display);

    std::expected<int, std::string> current_group() override;
    int group_count() override;
    std::vector<std::string> group_names() override;
    std::expected<void, std::string> lock_group(int group) override;

private:
    X11Display& display_;
};

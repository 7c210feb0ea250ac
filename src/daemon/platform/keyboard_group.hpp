#pragma once

#include <expected>
#include <string>
#include <vector>

// The keyboard device whose layout group is switched.
class KeyboardGroup {
public:
    virtual ~KeyboardGroup() = default;
    virtual std::expected<int, std::string> current_group() = 0;
    virtual int group_count() = 0;
    virtual std::vector<std::string> group_names() = 0;
    // Locks the active group. An error means the server rejected the request.
    virtual std::expected<void, std::string> lock_group(int group) = 0;
};

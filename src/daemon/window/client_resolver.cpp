#include "window/client_resolver.hpp"

#include <utility>

namespace {

// Deeper nesting than this is a broken tree, not a toolkit.
constexpr int kMaxDepth = 32;

} // namespace

ClientResolver::ClientResolver(WindowHandle root, ParentQuery parent_of, ClientCheck is_client)
    : root_(root), parent_of_(std::move(parent_of)), is_client_(std::move(is_client)) {}

WindowHandle ClientResolver::resolve(WindowHandle window) {
    WindowHandle current = window;
    for (int depth = 0; depth < kMaxDepth; depth++) {
        if (current == root_ || is_client_(current)) return current;

        auto up = parent(current);
        if (!up) return window;
        if (*up == root_) return current;
        current = *up;
    }
    return window;
}

void ClientResolver::forget(WindowHandle window) {
    parents_.erase(window);
}

std::optional<WindowHandle> ClientResolver::parent(WindowHandle window) {
    if (auto it = parents_.find(window); it != parents_.end()) return it->second;

    auto up = parent_of_(window);
    if (up) parents_.emplace(window, *up);
    return up;
}

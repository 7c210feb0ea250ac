#include "window/focus_tracker.hpp"

FocusTracker::FocusTracker(WindowRegistry& registry) : registry_(registry) {}

FocusChange FocusTracker::apply(const DisplayEvent& event) {
    switch (event.kind) {
        case DisplayEvent::Kind::Created:
        case DisplayEvent::Kind::PropertyChanged:
            registry_.upsert(event.window, event.properties);
            return FocusChange::None;

        case DisplayEvent::Kind::Destroyed:
            return registry_.remove(event.window) ? FocusChange::Lost : FocusChange::None;

        case DisplayEvent::Kind::FocusIn: {
            auto prev = registry_.focused();
            registry_.focus(event.window);
            return prev == event.window ? FocusChange::None : FocusChange::Gained;
        }

        case DisplayEvent::Kind::FocusOut:
            // The paired FocusIn of the next window is authoritative.
            return registry_.unfocus(event.window) ? FocusChange::Lost : FocusChange::None;

        case DisplayEvent::Kind::GroupChanged:
            break;
    }
    return FocusChange::None;
}

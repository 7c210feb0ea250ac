#pragma once

// Keyboard group bookkeeping for one run of the daemon. `current_group`
// caches the device state; only LayoutSwitcher and resynchronization from
// group-change events write it.
struct SessionState {
    int current_group = 0;
    int default_group = 0;
    int target_group = 1;
};

#pragma once

namespace platform {

// Detaches from the controlling terminal. Returns in the grandchild only;
// false if the first fork failed.
bool daemonize();

} // namespace platform

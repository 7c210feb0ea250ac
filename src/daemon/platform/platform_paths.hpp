#pragma once

#include <string>
#include <vector>

namespace platform {

// Candidate config files, most specific first: the per-user file, then the
// system-wide ones from $XDG_CONFIG_DIRS.
std::vector<std::string> config_search_path();

} // namespace platform

#pragma once
///@file

#include "debstrap/libutil/types.hh"

#include <vector>

namespace debstrap {

/**
 * Directories searched for per-user configuration, most specific first:
 * $XDG_CONFIG_HOME (or ~/.config), then each entry of $XDG_CONFIG_DIRS
 * (default /etc/xdg).
 */
std::vector<Path> getConfigDirs();

}

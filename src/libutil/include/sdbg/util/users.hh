#pragma once
///@file

#include <filesystem>
#include <vector>

namespace sdbg {

/**
 * `$HOME` if it is set and exists, otherwise the home directory in
 * the password database.
 */
std::filesystem::path getHome();

/**
 * The directories searched for `stupid-dbg.conf`, most specific
 * first: `$SDBG_CONFIG_HOME` (or `$XDG_CONFIG_HOME/stupid-dbg`, or
 * `~/.config/stupid-dbg`), then `stupid-dbg` in each of
 * `$XDG_CONFIG_DIRS` (default `/etc/xdg`).
 */
std::vector<std::filesystem::path> getConfigDirs();

/**
 * `$SDBG_DATA_HOME`, or `$XDG_DATA_HOME/stupid-dbg`, or
 * `~/.local/share/stupid-dbg`.
 */
std::filesystem::path getDataDir();

} // namespace sdbg

#pragma once
/**
 * @file
 *
 * Paths and whole-file operations.
 */

#include "sdbg/util/types.hh"

#include <filesystem>
#include <optional>

namespace sdbg {

/**
 * Make `path` absolute, relative to the working directory, and
 * normalise it lexically (no `.`, `..`, `//` or
 * trailing slash). Symlinks are not resolved.
 */
Path absPath(PathView path);

/**
 * Everything before the last `/`: `/` for `/foo`, `.` if there is
 * no slash at all.
 */
Path dirOf(PathView path);

/**
 * Whether `path` exists, without following a final symlink.
 */
bool pathExists(const std::filesystem::path & path);

std::string readFile(const Path & path);

/**
 * `mkdir -p`.
 */
void createDirs(const std::filesystem::path & path);

} // namespace sdbg

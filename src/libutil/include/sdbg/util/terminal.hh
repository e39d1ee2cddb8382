#pragma once
///@file

#include <string>
#include <string_view>

namespace sdbg {

/**
 * Whether stderr is a terminal that should get colours: not a pipe,
 * `TERM` is not `dumb`, and neither `NO_COLOR` nor `NOCOLOR` is set.
 */
bool isTTY();

/**
 * Remove ANSI escape sequences from `s`, except for colour changes
 * (SGR sequences) unless `filterAll` is set. Carriage returns and
 * bells are dropped too.
 */
std::string filterANSIEscapes(std::string_view s, bool filterAll = false);

} // namespace sdbg

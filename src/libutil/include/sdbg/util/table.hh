#pragma once
///@file

#include <iosfwd>
#include <string>
#include <vector>

namespace sdbg {

typedef std::vector<std::vector<std::string>> Table;

/**
 * Print the rows of `table`, padding every column but the last to the
 * width of its widest cell plus two spaces.
 */
void printTable(std::ostream & out, const Table & table);

} // namespace sdbg

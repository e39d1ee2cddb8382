#pragma once
///@file

#include "sdbg/util/args.hh"
#include "sdbg/util/exit.hh"
#include "sdbg/main/common-args.hh"

#include <functional>

namespace sdbg {

extern const std::string sdbgVersion;

/**
 * Run `fun`, turning the exceptions escaping it into an exit code after
 * reporting them.
 */
int handleExceptions(const std::string & programName, std::function<void()> fun);

/**
 * Process-wide start-up.
 * @param loadConfig Whether to load the configuration files and `SDBG_CONFIG`. May be disabled for unit tests.
 */
void initSdbg(bool loadConfig = true);

/**
 * Print the program version and exit.
 */
[[noreturn]] void printVersion(const std::string & programName);

} // namespace sdbg

#pragma once
///@file

#include "sdbg/util/args.hh"

namespace sdbg {

static constexpr auto loggingCategory = "Logging-related options";
static constexpr auto miscCategory = "Miscellaneous global options";

/**
 * Flags understood by every stupid-dbg program: verbosity, log format,
 * `--option` and one flag per setting.
 */
class MixCommonArgs : public virtual Args
{
public:
    std::string programName;
    MixCommonArgs(const std::string & programName);
};

} // namespace sdbg

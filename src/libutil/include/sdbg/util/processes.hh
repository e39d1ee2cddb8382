#pragma once
///@file

#include "sdbg/util/error.hh"

#include <string>

namespace sdbg {

/**
 * A child process could not run the requested program.
 */
class ExecError : public Error
{
public:
    /**
     * The child's wait status.
     */
    int status;

    template<typename... Args>
    ExecError(int status, const Args &... args)
        : Error(args...)
        , status(status)
    {
    }
};

/**
 * `SIGTRAP` and friends, or `signal N` for numbers without a name.
 */
std::string signalToString(int sig);

} // namespace sdbg

#pragma once
///@file

#include <exception>

namespace sdbg {

/**
 * Thrown to leave the program with `status` after unwinding, e.g.
 * after printing the version.
 */
class Exit : public std::exception
{
public:
    int status = 0;

    Exit() = default;

    explicit Exit(int status)
        : status(status)
    {
    }

    virtual ~Exit();
};

} // namespace sdbg

#pragma once
///@file

#include "sdbg/util/error.hh"

#include <atomic>

#include <signal.h>

namespace sdbg {

/**
 * Set by the SIGINT handler of `ReceiveInterrupts`, cleared by whoever
 * deals with the interruption.
 */
extern std::atomic<bool> interruptRequested;

inline void setInterrupted(bool interrupted)
{
    interruptRequested = interrupted;
}

inline bool isInterrupted()
{
    return interruptRequested;
}

/**
 * The user pressed Ctrl-C. Derives from `BaseError` rather than
 * `Error`, so that handlers for ordinary errors let it through.
 */
MakeError(Interrupted, BaseError);

/**
 * Throw `Interrupted`, and clear the flag, if Ctrl-C was pressed.
 */
void checkInterrupt();

/**
 * While alive, SIGINT sets `interruptRequested` instead of killing us.
 *
 * `SA_RESTART` is not used, so blocking calls such as `waitpid()` fail
 * with `EINTR` and their caller can react.
 */
struct ReceiveInterrupts
{
    struct sigaction old;

    ReceiveInterrupts();
    ReceiveInterrupts(const ReceiveInterrupts &) = delete;
    ~ReceiveInterrupts();
};

} // namespace sdbg

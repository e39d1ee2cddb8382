#include "sdbg/util/signals.hh"
#include "sdbg/util/logging.hh"

namespace sdbg {

std::atomic<bool> interruptRequested = false;

void checkInterrupt()
{
    if (interruptRequested.exchange(false))
        throw Interrupted("interrupted by the user");
}

static void onSigint(int)
{
    interruptRequested = true;
}

ReceiveInterrupts::ReceiveInterrupts()
{
    struct sigaction act = {};
    act.sa_handler = onSigint;
    sigemptyset(&act.sa_mask);
    if (sigaction(SIGINT, &act, &old) == -1)
        throw SysError("installing the SIGINT handler");
}

ReceiveInterrupts::~ReceiveInterrupts()
{
    if (sigaction(SIGINT, &old, nullptr) == -1)
        printError("restoring the SIGINT handler: %s", strerror(errno));
}

} // namespace sdbg

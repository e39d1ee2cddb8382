#include "sdbg/util/processes.hh"

#include <cstring>

namespace sdbg {

std::string signalToString(int sig)
{
    auto abbrev = sigabbrev_np(sig);
    return abbrev ? std::string("SIG") + abbrev : fmt("signal %d", sig);
}

} // namespace sdbg

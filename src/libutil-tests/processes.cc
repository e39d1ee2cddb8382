#include "sdbg/util/processes.hh"

#include <gtest/gtest.h>

#include <signal.h>

namespace sdbg {

TEST(signalToString, knownSignals)
{
    ASSERT_EQ(signalToString(SIGTRAP), "SIGTRAP");
    ASSERT_EQ(signalToString(SIGKILL), "SIGKILL");
    ASSERT_EQ(signalToString(SIGSTOP), "SIGSTOP");
}

TEST(signalToString, unknownSignal)
{
    ASSERT_EQ(signalToString(12345), "signal 12345");
}

TEST(ExecError, keepsWaitStatus)
{
    ExecError e(127 << 8, "failed to launch debuggee: %s", "No such file or directory");

    ASSERT_EQ(e.status, 127 << 8);
    ASSERT_EQ(e.message(), "failed to launch debuggee: " ANSI_WARNING "No such file or directory" ANSI_NORMAL);
}

} // namespace sdbg

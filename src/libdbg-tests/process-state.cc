#include "sdbg/dbg/process-state.hh"

#include <gtest/gtest.h>

#include <signal.h>
#include <sstream>

namespace sdbg {

TEST(ProcessState, isAlive)
{
    ASSERT_TRUE(ProcessState{ProcessState::Running{}}.isAlive());
    ASSERT_TRUE(ProcessState{ProcessState::Stopped{SIGTRAP}}.isAlive());
    ASSERT_FALSE(ProcessState{ProcessState::Exited{0}}.isAlive());
    ASSERT_FALSE(ProcessState{ProcessState::Terminated{SIGKILL}}.isAlive());
}

TEST(ProcessState, isStopped)
{
    ASSERT_TRUE(ProcessState{ProcessState::Stopped{}}.isStopped());
    ASSERT_FALSE(ProcessState{ProcessState::Running{}}.isStopped());
}

TEST(ProcessState, to_string)
{
    ASSERT_EQ(ProcessState{ProcessState::Running{}}.to_string(), "running");
    ASSERT_EQ(ProcessState{ProcessState::Stopped{}}.to_string(), "stopped");
    ASSERT_EQ(ProcessState{ProcessState::Stopped{SIGTRAP}}.to_string(), "stopped with signal: SIGTRAP");
    ASSERT_EQ(ProcessState{ProcessState::Exited{}}.to_string(), "exited");
    ASSERT_EQ(ProcessState{ProcessState::Exited{3}}.to_string(), "exited with status code: 3");
    ASSERT_EQ(ProcessState{ProcessState::Terminated{SIGKILL}}.to_string(), "terminated with signal: SIGKILL");
}

TEST(ProcessState, streams)
{
    std::ostringstream out;
    out << ProcessState{ProcessState::Exited{0}};

    ASSERT_EQ(out.str(), "exited with status code: 0");
}

TEST(ProcessState, equality)
{
    ASSERT_EQ(ProcessState{ProcessState::Stopped{SIGSTOP}}, ProcessState{ProcessState::Stopped{SIGSTOP}});
    ASSERT_NE(ProcessState{ProcessState::Stopped{SIGSTOP}}, ProcessState{ProcessState::Stopped{}});
    ASSERT_NE(ProcessState{ProcessState::Exited{}}, ProcessState{ProcessState::Running{}});
}

} // namespace sdbg

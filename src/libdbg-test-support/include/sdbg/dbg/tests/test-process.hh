#pragma once
///@file

#include "sdbg/util/types.hh"

#include <sys/types.h>

namespace sdbg::testing {

/**
 * `$SDBG_TEST_PROGRAM_RUNNING_ENDLESSLY`, or `yes`.
 */
std::string programRunningEndlessly();

/**
 * `$SDBG_TEST_PROGRAM_EXITING_IMMEDIATELY`, or `true`.
 */
std::string programExitingImmediately();

/**
 * Whether a process with this PID exists (possibly as a zombie).
 */
bool processExists(pid_t pid);

/**
 * The state letter from `/proc/<pid>/stat`, e.g. `R`, `S` or `t` for a
 * tracing stop.
 */
char procState(pid_t pid);

/**
 * A child process started without tracing, with standard output and
 * error sent to `/dev/null`. It is killed and reaped on destruction.
 */
class TestProcess
{
    pid_t _pid;

public:
    TestProcess(const Strings & args);

    TestProcess(const TestProcess &) = delete;

    ~TestProcess();

    pid_t pid() const
    {
        return _pid;
    }
};

} // namespace sdbg::testing

#include "sdbg/dbg/tests/test-process.hh"
#include "sdbg/util/environment-variables.hh"
#include "sdbg/util/error.hh"
#include "sdbg/util/file-descriptor.hh"
#include "sdbg/util/file-system.hh"
#include "sdbg/util/logging.hh"
#include "sdbg/util/strings.hh"

#include <cerrno>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace sdbg::testing {

std::string programRunningEndlessly()
{
    return getEnv("SDBG_TEST_PROGRAM_RUNNING_ENDLESSLY").value_or("yes");
}

std::string programExitingImmediately()
{
    return getEnv("SDBG_TEST_PROGRAM_EXITING_IMMEDIATELY").value_or("true");
}

bool processExists(pid_t pid)
{
    return kill(pid, 0) == 0 || errno != ESRCH;
}

char procState(pid_t pid)
{
    auto stat = readFile(fmt("/proc/%d/stat", pid));
    /* The command name is in parentheses and may contain spaces. */
    auto end = stat.rfind(')');
    if (end == stat.npos || end + 2 >= stat.size())
        throw Error("cannot parse '/proc/%d/stat'", pid);
    return stat[end + 2];
}

TestProcess::TestProcess(const Strings & args)
{
    Pipe errPipe;
    errPipe.create();

    _pid = fork();
    if (_pid == -1)
        throw SysError("unable to fork");

    if (_pid == 0) {
        errPipe.readSide.close();
        int devNull = open("/dev/null", O_WRONLY);
        if (devNull != -1) {
            dup2(devNull, STDOUT_FILENO);
            dup2(devNull, STDERR_FILENO);
        }
        std::vector<char *> argv;
        for (auto & arg : args)
            argv.push_back(const_cast<char *>(arg.c_str()));
        argv.push_back(nullptr);
        execvp(argv[0], argv.data());
        auto msg = fmt("executing '%s': %s", args.front(), strerror(errno));
        auto n = write(errPipe.writeSide.get(), msg.data(), msg.size());
        _exit(n < 0 ? 2 : 1);
    }

    errPipe.writeSide.close();
    auto msg = drainFD(errPipe.readSide.get());
    if (!msg.empty()) {
        waitpid(_pid, nullptr, 0);
        throw Error("test process failed to launch: %s", msg);
    }
}

TestProcess::~TestProcess()
{
    if (kill(_pid, SIGKILL) == -1)
        warn("killing test process %d: %s", _pid, strerror(errno));
    while (waitpid(_pid, nullptr, 0) == -1 && errno == EINTR)
        ;
}

} // namespace sdbg::testing

#include "sdbg/dbg/debuggee.hh"
#include "sdbg/dbg/globals.hh"
#include "sdbg/dbg/ptrace.hh"
#include "sdbg/util/file-descriptor.hh"
#include "sdbg/util/logging.hh"
#include "sdbg/util/processes.hh"
#include "sdbg/util/signals.hh"
#include "sdbg/util/terminal.hh"

#include <cerrno>
#include <cstring>

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sdbg {

Debuggee::Debuggee(pid_t pid, bool shouldTerminate)
    : _pid(pid)
    , shouldTerminate(shouldTerminate)
{
}

std::unique_ptr<Debuggee> Debuggee::create(const DebuggeeConfig & config)
{
    auto debuggee = std::visit(
        overloaded{
            [](const DebuggeeConfig::Existing & e) {
                return std::unique_ptr<Debuggee>(new Debuggee(attach(e.pid), false));
            },
            [](const DebuggeeConfig::SpawnChild & c) {
                return std::unique_ptr<Debuggee>(new Debuggee(launch(c.args), true));
            },
        },
        config.raw);

    printInfo("debugging process %d", debuggee->pid());

    debuggee->updateProcessState(true);

    return debuggee;
}

pid_t Debuggee::attach(pid_t pid)
{
    Activity act(*logger, lvlDebug, actAttach, fmt("attaching to process %d", pid));

    try {
        ptrace::attach(pid);
    } catch (SysError & e) {
        e.addContext("unable to attach to debuggee process %d", pid);
        throw;
    }

    return pid;
}

pid_t Debuggee::launch(const Strings & args)
{
    if (args.empty())
        throw Error("no child argument provided");

    Activity act(*logger, lvlDebug, actLaunch, fmt("launching '%s'", args.front()));

    /* The child reports a failure to exec() through this pipe. On
       success, exec() closes the write side and the parent reads EOF. */
    Pipe errPipe;
    errPipe.create();

    pid_t pid = fork();
    if (pid == -1)
        throw SysError("unable to fork");

    if (pid == 0) {
        errPipe.readSide.close();
        try {
            ptrace::traceMe();

            std::vector<char *> argv;
            for (auto & arg : args)
                argv.push_back(const_cast<char *>(arg.c_str()));
            argv.push_back(nullptr);

            execvp(argv[0], argv.data());

            throw SysError("executing '%s'", args.front());
        } catch (std::exception & e) {
            auto * base = dynamic_cast<BaseError *>(&e);
            try {
                writeFull(errPipe.writeSide.get(), base ? base->message() : std::string(e.what()), false);
            } catch (SysError &) {
                /* Nobody left to tell; the exit status still reports it. */
            }
        }
        _exit(1);
    }

    errPipe.writeSide.close();
    auto msg = drainFD(errPipe.readSide.get());

    if (!msg.empty()) {
        int status = 0;
        while (waitpid(pid, &status, 0) == -1)
            if (errno != EINTR)
                throw SysError("waiting for failed debuggee %d", pid);
        throw ExecError(status, "failed to launch debuggee: %s", filterANSIEscapes(msg, true));
    }

    return pid;
}

void Debuggee::updateProcessState(bool blocking)
{
    /* The process is gone and was reaped; waiting again would only lose
       its exit status. */
    if (!state.isAlive())
        return;

    Activity act(*logger, lvlVomit, actWait, fmt("waiting for process %d", _pid));

    std::optional<ReceiveInterrupts> receiveInterrupts;
    if (blocking)
        receiveInterrupts.emplace();

    int status = 0;
    pid_t res;

    while (true) {
        /* Ctrl-C interrupts waitpid() with EINTR, or arrives just before
           it. Either way the debuggee is stopped so that the wait ends. */
        if (blocking && isInterrupted()) {
            setInterrupted(false);
            if (settings.stopAttachedOnInterrupt) {
                printInfo("interrupted, stopping process %d", _pid);
                if (kill(_pid, SIGSTOP) == -1)
                    throw SysError("sending SIGSTOP to process %d", _pid);
            }
        }

        res = waitpid(_pid, &status, blocking ? 0 : WNOHANG);
        if (res != -1)
            break;

        if (errno == EINTR)
            continue;

        if (errno == ECHILD) {
            /* Already reaped, or not ours to wait for any more. */
            state = ProcessState::Exited{};
            regs.reset();
            act.result(resProcessState, state.to_string());
            return;
        }

        throw SysError("waiting for process %d", _pid);
    }

    if (res == 0) {
        if (!state.isStopped())
            state = ProcessState::Running{};
    } else if (WIFEXITED(status))
        state = ProcessState::Exited{WEXITSTATUS(status)};
    else if (WIFSIGNALED(status))
        state = ProcessState::Terminated{WTERMSIG(status)};
    else if (WIFSTOPPED(status))
        state = ProcessState::Stopped{WSTOPSIG(status)};
    else if (WIFCONTINUED(status))
        state = ProcessState::Running{};

    if (state.isStopped())
        regs = Registers::readWithPtrace(_pid);
    else
        regs.reset();

    act.result(resProcessState, state.to_string());
}

void Debuggee::resume()
{
    if (!state.isAlive())
        throw Error("unable to resume an exited or terminated process");

    Activity act(*logger, lvlDebug, actResume, fmt("resuming process %d", _pid));

    ptrace::cont(_pid);

    state = ProcessState::Running{};
    regs.reset();

    printInfo("process %d resumed", _pid);
}

void Debuggee::detach()
{
    Activity act(*logger, lvlDebug, actDetach, fmt("detaching from process %d", _pid));

    updateProcessState(false);

    if (!state.isAlive())
        return;

    if (shouldTerminate && settings.killSpawnedOnDetach) {
        if (kill(_pid, SIGKILL) == -1)
            throw SysError("killing process %d", _pid);
        while (waitpid(_pid, nullptr, 0) == -1)
            if (errno != EINTR)
                throw SysError("reaping process %d", _pid);
        return;
    }

    /* PTRACE_DETACH requires a stopped tracee. */
    if (!state.isStopped()) {
        if (kill(_pid, SIGSTOP) == -1)
            throw SysError("sending SIGSTOP to process %d", _pid);
        updateProcessState(true);
        if (!state.isAlive())
            return;
    }

    ptrace::detach(_pid);

    if (kill(_pid, SIGCONT) == -1)
        throw SysError("sending SIGCONT to process %d", _pid);
}

Debuggee::~Debuggee()
{
    try {
        detach();
    } catch (...) {
        ignoreExceptionInDestructor(lvlWarn);
    }
}

} // namespace sdbg

#pragma once
///@file

#include "sdbg/dbg/process-state.hh"
#include "sdbg/dbg/registers.hh"
#include "sdbg/util/types.hh"
#include "sdbg/util/variant-wrapper.hh"

#include <memory>
#include <optional>

#include <sys/types.h>

namespace sdbg {

/**
 * How to obtain a debuggee.
 */
struct DebuggeeConfig
{
    /**
     * Attach to a running process.
     */
    struct Existing
    {
        pid_t pid;
    };

    /**
     * Start a new process under tracing. `args[0]` is the program,
     * looked up in `PATH`.
     */
    struct SpawnChild
    {
        Strings args;
    };

    using Raw = std::variant<Existing, SpawnChild>;

    Raw raw;

    MAKE_WRAPPER_CONSTRUCTOR(DebuggeeConfig);
};

/**
 * A process traced by us. Destroying a `Debuggee` detaches from the
 * process, killing it if we started it.
 */
class Debuggee
{
    pid_t _pid;

    ProcessState state = ProcessState::Stopped{};

    /**
     * Whether we started the process, and thus kill it on detach.
     */
    bool shouldTerminate;

    /**
     * Present while the process is stopped.
     */
    std::optional<Registers> regs;

    Debuggee(pid_t pid, bool shouldTerminate);

    static pid_t attach(pid_t pid);

    static pid_t launch(const Strings & args);

    void detach();

public:

    /**
     * Attach to or spawn the process described by `config`, and wait
     * for its initial stop.
     */
    static std::unique_ptr<Debuggee> create(const DebuggeeConfig & config);

    Debuggee(const Debuggee &) = delete;
    Debuggee & operator=(const Debuggee &) = delete;

    ~Debuggee();

    pid_t pid() const
    {
        return _pid;
    }

    const ProcessState & processState() const
    {
        return state;
    }

    /**
     * @return The registers of the stopped process, or `nullptr` if it
     * is not stopped.
     */
    Registers * registers()
    {
        return regs ? &*regs : nullptr;
    }

    const Registers * registers() const
    {
        return regs ? &*regs : nullptr;
    }

    /**
     * Observe a state change of the process with `waitpid()`. If
     * `blocking` is false and nothing changed, a stopped process stays
     * stopped and anything else is considered running.
     *
     * While blocking, Ctrl-C stops the process with `SIGSTOP` (if
     * `stop-attached-on-interrupt` is set) and the wait goes on.
     */
    void updateProcessState(bool blocking);

    /**
     * Let a stopped process continue. No signal is delivered to it.
     *
     * @throws Error if the process has exited or was terminated.
     */
    void resume();
};

} // namespace sdbg

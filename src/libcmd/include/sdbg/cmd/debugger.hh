#pragma once
/**
 * @file
 *
 * @brief The debugger command set and its interactive loop.
 */

#include "sdbg/cmd/repl-interacter.hh"
#include "sdbg/dbg/debuggee.hh"

#include <memory>
#include <optional>

namespace sdbg {

/**
 * What the caller should do after a command ran.
 */
struct CommandResult
{
    bool quit = false;
};

class Debugger : public ReplCompleter
{
    std::unique_ptr<Debuggee> debuggee;

    Debuggee & requireDebuggee();

    Registers & requireRegisters();

public:

    Debugger();

    ~Debugger();

    Debuggee * currentDebuggee()
    {
        return debuggee.get();
    }

    /**
     * The names of all commands, for completion and help.
     */
    static StringSet commandNames();

    CommandResult attach(pid_t pid);

    CommandResult run(const Strings & args);

    CommandResult detach();

    CommandResult resume();

    CommandResult status();

    /**
     * Print the named registers, or every 64-bit general purpose
     * register if `names` is empty and `all` is false.
     */
    CommandResult readRegisters(const Strings & names, bool all);

    CommandResult writeRegister(const std::string & name, const std::string & value);

    CommandResult help(const std::optional<std::string> & command);

    /**
     * Split `line` into words like a shell would, and run the command
     * they name. Empty lines do nothing.
     *
     * @throws UsageError if the words do not form a valid command.
     */
    CommandResult executeLine(const std::string & line);

    /**
     * Read and execute lines until `quit`, Ctrl-D or Ctrl-C. Errors of
     * individual commands are logged.
     */
    void repl(ReplInteracter & interacter);

    /**
     * Run the REPL on the terminal, with the history and prompt from
     * `settings`.
     */
    void repl();

    StringSet completeLine(const std::string & line) override;
};

}

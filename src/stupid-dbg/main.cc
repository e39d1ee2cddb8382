#include "sdbg/cmd/debugger.hh"
#include "sdbg/main/common-args.hh"
#include "sdbg/main/shared.hh"
#include "sdbg/util/args.hh"
#include "sdbg/util/logging.hh"

#include <iostream>

namespace sdbg {

struct StupidDbgArgs : virtual MixCommonArgs
{
    std::optional<pid_t> pid;
    std::vector<std::string> program;
    bool helpRequested = false;
    bool showVersion = false;

    StupidDbgArgs()
        : MixCommonArgs("stupid-dbg")
    {
        addFlag({
            .longName = "pid",
            .shortName = 'p',
            .description = "Attach to the process *pid* on start-up.",
            .labels = {"pid"},
            .handler = {&pid},
        });

        addFlag({
            .longName = "help",
            .description = "Show usage information.",
            .category = miscCategory,
            .handler = {[this]() { helpRequested = true; }},
        });

        addFlag({
            .longName = "version",
            .description = "Show version information.",
            .category = miscCategory,
            .handler = {[this]() { showVersion = true; }},
        });

        expectArgs({.label = "program", .optional = true, .handler = {&program}});
    }

    std::string description() override
    {
        return "an interactive debugger for x86-64 Linux processes";
    }

    std::string doc() override
    {
        return R"(
          With `--pid`, attach to a running process. With a program,
          start it under the debugger; put `--` before the program if
          any of its arguments start with `-`. Then read commands
          interactively; type `help` for a list.
        )";
    }
};

static void mainWrapped(int argc, char ** argv)
{
    initSdbg();

    StupidDbgArgs args;
    args.parseCmdline(argvToStrings(argc, argv));

    if (args.helpRequested) {
        args.printHelp(args.programName, std::cout);
        return;
    }

    if (args.showVersion)
        printVersion(args.programName);

    applyJSONLogger();

    if (args.pid && !args.program.empty())
        throw UsageError("ambiguous debuggee config");

    Debugger debugger;

    try {
        if (args.pid)
            debugger.attach(*args.pid);
        else if (!args.program.empty())
            debugger.run(Strings(args.program.begin(), args.program.end()));
    } catch (Error & e) {
        e.addContext("failed to execute command");
        logError(e.info());
    }

    debugger.repl();
}

} // namespace sdbg

int main(int argc, char ** argv)
{
    return sdbg::handleExceptions(argv[0], [&]() { sdbg::mainWrapped(argc, argv); });
}

#include "sdbg/cmd/debugger.hh"
#include "sdbg/dbg/globals.hh"
#include "sdbg/dbg/register.hh"
#include "sdbg/util/args.hh"
#include "sdbg/util/logging.hh"
#include "sdbg/util/signals.hh"
#include "sdbg/util/strings.hh"
#include "sdbg/util/suggestions.hh"
#include "sdbg/util/table.hh"

#include <sstream>

namespace sdbg {

/**
 * A command of the debugger. Parsing fills in the members of the
 * concrete command; `exec()` then acts on the `Debugger`.
 */
struct DebuggerCommand : virtual Command
{
    Debugger & debugger;

    CommandResult result;

    DebuggerCommand(Debugger & debugger)
        : debugger(debugger)
    {
    }

    virtual CommandResult exec() = 0;

    void run() override
    {
        result = exec();
    }
};

struct CmdAttach : DebuggerCommand
{
    pid_t pid = 0;

    CmdAttach(Debugger & debugger)
        : DebuggerCommand(debugger)
    {
        expectArgs({.label = "pid", .handler = {&pid}});
    }

    std::string description() override
    {
        return "attach to a running process";
    }

    CommandResult exec() override
    {
        return debugger.attach(pid);
    }
};

struct CmdRun : DebuggerCommand
{
    std::vector<std::string> args;

    CmdRun(Debugger & debugger)
        : DebuggerCommand(debugger)
    {
        expectArgs("program", &args);
    }

    std::string description() override
    {
        return "start a program under the debugger";
    }

    std::string doc() override
    {
        return R"(
          The program is looked up in `PATH`. Put `--` before the
          program if its arguments start with `-`, e.g.
          `run -- ls -l`.
        )";
    }

    CommandResult exec() override
    {
        return debugger.run(Strings(args.begin(), args.end()));
    }
};

struct CmdDetach : DebuggerCommand
{
    using DebuggerCommand::DebuggerCommand;

    std::string description() override
    {
        return "detach from the debuggee, killing it if it was started with `run`";
    }

    CommandResult exec() override
    {
        return debugger.detach();
    }
};

struct CmdContinue : DebuggerCommand
{
    using DebuggerCommand::DebuggerCommand;

    std::string description() override
    {
        return "resume the debuggee and wait until it stops again (alias: `c`)";
    }

    CommandResult exec() override
    {
        return debugger.resume();
    }
};

struct CmdStatus : DebuggerCommand
{
    using DebuggerCommand::DebuggerCommand;

    std::string description() override
    {
        return "show the state of the debuggee";
    }

    CommandResult exec() override
    {
        return debugger.status();
    }
};

struct CmdRegisterRead : DebuggerCommand
{
    std::vector<std::string> names;
    bool all = false;

    CmdRegisterRead(Debugger & debugger)
        : DebuggerCommand(debugger)
    {
        addFlag({
            .longName = "all",
            .description = "Show every register.",
            .handler = {&all, true},
        });
        expectArgs("names", &names);
    }

    std::string description() override
    {
        return "print registers (default: the 64-bit general purpose ones)";
    }

    CommandResult exec() override
    {
        return debugger.readRegisters(Strings(names.begin(), names.end()), all);
    }
};

struct CmdRegisterWrite : DebuggerCommand
{
    std::string name, value;

    CmdRegisterWrite(Debugger & debugger)
        : DebuggerCommand(debugger)
    {
        expectArg("name", &name);
        expectArg("value", &value);
    }

    std::string description() override
    {
        return "set a register";
    }

    std::string doc() override
    {
        return R"(
          Integer registers take a decimal or `0x` hexadecimal value,
          `st0`..`st7` a floating point number, and vector registers a
          list of bytes such as `[0x01,0x02,...]`.
        )";
    }

    CommandResult exec() override
    {
        return debugger.writeRegister(name, value);
    }
};

struct CmdRegister : MultiCommand, DebuggerCommand
{
    CmdRegister(Debugger & debugger)
        : MultiCommand(
              "register",
              {
                  {"read", [&debugger]() { return std::make_shared<CmdRegisterRead>(debugger); }},
                  {"write", [&debugger]() { return std::make_shared<CmdRegisterWrite>(debugger); }},
              })
        , DebuggerCommand(debugger)
    {
    }

    std::string description() override
    {
        return "read or write registers of the stopped debuggee";
    }

    CommandResult exec() override
    {
        auto sub = std::dynamic_pointer_cast<DebuggerCommand>(command->second);
        sub->run();
        return sub->result;
    }
};

struct CmdHelp : DebuggerCommand
{
    std::optional<std::string> commandName;

    CmdHelp(Debugger & debugger)
        : DebuggerCommand(debugger)
    {
        expectArgs({.label = "command", .optional = true, .handler = {&commandName}});
    }

    std::string description() override
    {
        return "list the commands, or describe one";
    }

    CommandResult exec() override
    {
        return debugger.help(commandName);
    }
};

struct CmdQuit : DebuggerCommand
{
    using DebuggerCommand::DebuggerCommand;

    std::string description() override
    {
        return "leave the debugger (alias: `q`)";
    }

    CommandResult exec() override
    {
        return {.quit = true};
    }
};

static Commands debuggerCommands(Debugger & debugger)
{
    auto make = [&debugger]<typename C>() -> std::function<std::shared_ptr<Command>()> {
        return [&debugger]() { return std::make_shared<C>(debugger); };
    };

    return {
        {"attach", make.operator()<CmdAttach>()},
        {"run", make.operator()<CmdRun>()},
        {"detach", make.operator()<CmdDetach>()},
        {"continue", make.operator()<CmdContinue>()},
        {"status", make.operator()<CmdStatus>()},
        {"register", make.operator()<CmdRegister>()},
        {"help", make.operator()<CmdHelp>()},
        {"quit", make.operator()<CmdQuit>()},
    };
}

static const std::map<std::string, std::string> commandAliases = {
    {"c", "continue"},
    {"q", "quit"},
};

/**
 * The top-level parser of a debugger command line.
 */
struct DebuggerCommandLine : MultiCommand
{
    DebuggerCommandLine(Debugger & debugger)
        : MultiCommand("stupid-dbg", debuggerCommands(debugger))
    {
    }
};

Debugger::Debugger() {}

Debugger::~Debugger() {}

StringSet Debugger::commandNames()
{
    Debugger dummy;
    StringSet names;
    for (auto & [name, _] : debuggerCommands(dummy))
        names.insert(name);
    for (auto & [alias, _] : commandAliases)
        names.insert(alias);
    return names;
}

Debuggee & Debugger::requireDebuggee()
{
    if (!debuggee)
        throw Error("no debuggee; use `attach` or `run` first");
    return *debuggee;
}

Registers & Debugger::requireRegisters()
{
    auto * regs = requireDebuggee().registers();
    if (!regs)
        throw Error("debuggee is not stopped");
    return *regs;
}

CommandResult Debugger::attach(pid_t pid)
{
    if (debuggee) {
        warn("use `detach` to detach from the current debuggee first");
        return {};
    }
    debuggee = Debuggee::create(DebuggeeConfig::Existing{pid});
    return {};
}

CommandResult Debugger::run(const Strings & args)
{
    if (debuggee) {
        warn("use `detach` to detach from the current debuggee first");
        return {};
    }
    if (args.empty())
        throw Error("no child argument provided");
    debuggee = Debuggee::create(DebuggeeConfig::SpawnChild{args});
    return {};
}

CommandResult Debugger::detach()
{
    if (!debuggee)
        warn("no debuggee, do nothing");
    debuggee.reset();
    return {};
}

CommandResult Debugger::resume()
{
    if (!debuggee) {
        warn("no debuggee, do nothing");
        return {};
    }
    debuggee->resume();
    debuggee->updateProcessState(true);
    logger->cout("process %d: %s", debuggee->pid(), debuggee->processState().to_string());
    return {};
}

CommandResult Debugger::status()
{
    if (!debuggee) {
        warn("no debuggee, do nothing");
        return {};
    }
    debuggee->updateProcessState(false);
    logger->cout("process %d: %s", debuggee->pid(), debuggee->processState().to_string());
    return {};
}

CommandResult Debugger::readRegisters(const Strings & names, bool all)
{
    auto & regs = requireRegisters();

    std::vector<const RegisterInfo *> infos;
    if (!names.empty()) {
        for (auto & name : names)
            infos.push_back(&registerInfoByName(name));
    } else
        for (auto & info : allRegisters())
            if (all || info.kind == RegisterKind::GeneralPurpose)
                infos.push_back(&info);

    Table table;
    for (auto * info : infos)
        table.push_back({std::string(info->name), formatRegisterValue(regs.read(info->id))});

    std::ostringstream out;
    printTable(out, table);
    logger->writeToStdout(chomp(out.str()));
    return {};
}

CommandResult Debugger::writeRegister(const std::string & name, const std::string & value)
{
    auto & info = registerInfoByName(name);
    auto & regs = requireRegisters();

    Activity act(*logger, lvlDebug, actWriteRegisters, fmt("writing register '%s'", info.name));

    regs.write(info.id, parseRegisterValue(info, value));

    act.result(resRegisterValue, std::string(info.name), formatRegisterValue(regs.read(info.id)));
    return {};
}

CommandResult Debugger::help(const std::optional<std::string> & command)
{
    DebuggerCommandLine root(*this);
    std::ostringstream out;

    if (!command) {
        Table table;
        for (auto & [name, commandFun] : root.commands)
            table.push_back({"  " + name, trim(commandFun()->description())});
        out << "Commands:\n";
        printTable(out, table);
        out << "\nType 'help <command>' for details about a command.";
        logger->writeToStdout(out.str());
        return {};
    }

    auto name = *command;
    if (auto alias = commandAliases.find(name); alias != commandAliases.end())
        name = alias->second;

    auto i = root.commands.find(name);
    if (i == root.commands.end())
        throw UsageError(
            Suggestions::bestMatches(commandNames(), *command), "'%s' is not a recognised command", *command);

    i->second()->printHelp(name, out);
    logger->writeToStdout(chomp(out.str()));
    return {};
}

CommandResult Debugger::executeLine(const std::string & line)
{
    auto words = shellSplitString(line);
    if (words.empty())
        return {};

    if (auto alias = commandAliases.find(words.front()); alias != commandAliases.end())
        words.front() = alias->second;

    DebuggerCommandLine root(*this);
    root.parseCmdline(words);

    auto command = std::dynamic_pointer_cast<DebuggerCommand>(root.command->second);
    command->run();
    return command->result;
}

void Debugger::repl(ReplInteracter & interacter)
{
    Activity act(*logger, lvlDebug, actRepl, "debugger REPL");

    auto _guard = interacter.init(static_cast<ReplCompleter *>(this));

    std::string input;

    while (true) {
        ReplInput res;
        {
            auto suspension = logger->suspend();
            res = interacter.getLine(input, settings.prompt);
        }

        if (res == ReplInput::EndOfFile) {
            printInfo("ctrl-d");
            break;
        }
        if (res == ReplInput::Interrupted) {
            printInfo("ctrl-c");
            break;
        }

        try {
            if (executeLine(input).quit)
                break;
        } catch (Error & e) {
            e.addContext("failed to execute command");
            logError(e.info());
        } catch (Interrupted & e) {
            printError(e.msg());
        }

        setInterrupted(false);
    }
}

void Debugger::repl()
{
    ReadlineInteracter interacter(settings.historyFile.get(), settings.historySize);
    repl(interacter);
}

StringSet Debugger::completeLine(const std::string & line)
{
    auto words = tokenizeString<std::vector<std::string>>(line);

    /* The word under the cursor is empty if the line ends in blank
       space. */
    std::string cur;
    if (!words.empty() && !line.empty() && !isspace((unsigned char) line.back())) {
        cur = words.back();
        words.pop_back();
    }

    StringSet candidates;

    if (words.empty())
        candidates = commandNames();
    else if (words[0] == "help" && words.size() == 1)
        candidates = commandNames();
    else if (words[0] == "register") {
        if (words.size() == 1)
            candidates = {"read", "write"};
        else if ((words[1] == "read") || (words[1] == "write" && words.size() == 2)) {
            for (auto & info : allRegisters())
                candidates.insert(std::string(info.name));
            if (words[1] == "read")
                candidates.insert("--all");
        }
    }

    StringSet completions;
    for (auto & c : candidates)
        if (hasPrefix(c, cur))
            completions.insert(c);
    return completions;
}

}

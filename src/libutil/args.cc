#include "sdbg/util/args.hh"
#include "sdbg/util/ansicolor.hh"
#include "sdbg/util/table.hh"

#include <cassert>
#include <cctype>
#include <iterator>
#include <ostream>

namespace sdbg {

void Args::addFlag(Flag && flag)
{
    assert(!flag.longName.empty());
    assert(flag.handler.arity == ArityAny || flag.handler.arity == flag.labels.size());

    auto ptr = std::make_shared<Flag>(std::move(flag));
    longFlags[ptr->longName] = ptr;
    if (ptr->shortName)
        shortFlags[ptr->shortName] = ptr;
}

/**
 * `-vvv` becomes `-v -v -v`, and `-p42` becomes `-p 42`: letters are
 * split off one by one until the first non-letter.
 */
static void expandShortFlags(Strings & cmdline, Strings::iterator pos)
{
    auto word = *pos;
    *pos = word.substr(0, 2);
    auto next = std::next(pos);
    for (size_t i = 2; i < word.size(); ++i) {
        if (!isalpha(word[i])) {
            cmdline.insert(next, word.substr(i));
            break;
        }
        cmdline.insert(next, std::string("-") + word[i]);
    }
}

void Args::parseCmdline(const Strings & _cmdline)
{
    Strings cmdline(_cmdline);
    Strings pending;
    bool flagsDone = false;

    for (auto pos = cmdline.begin(); pos != cmdline.end();) {
        if (!flagsDone && pos->size() > 2 && (*pos)[0] == '-' && isalpha((*pos)[1]))
            expandShortFlags(cmdline, pos);

        if (!flagsDone && *pos == "--") {
            flagsDone = true;
            ++pos;
        } else if (!flagsDone && hasPrefix(*pos, "-")) {
            auto flag = *pos;
            if (!processFlag(pos, cmdline.end()))
                throw UsageError("unrecognised flag '%s'", flag);
        } else {
            pending.push_back(*pos++);
            if (processArgs(pending, false))
                pending.clear();
        }
    }

    processArgs(pending, true);
    checkArgs();
}

bool Args::processFlag(Strings::iterator & pos, Strings::iterator end)
{
    std::shared_ptr<Flag> flag;
    if (hasPrefix(*pos, "--")) {
        if (auto i = longFlags.find(pos->substr(2)); i != longFlags.end())
            flag = i->second;
    } else if (pos->size() == 2) {
        if (auto i = shortFlags.find((*pos)[1]); i != shortFlags.end())
            flag = i->second;
    }
    if (!flag)
        return false;

    auto name = *pos++;
    std::vector<std::string> words;
    while (words.size() < flag->handler.arity && pos != end)
        words.push_back(*pos++);
    if (flag->handler.arity != ArityAny && words.size() < flag->handler.arity)
        throw UsageError(
            "flag '%s' requires %d argument(s), but only %d were given", name, flag->handler.arity, words.size());

    flag->handler.fun(std::move(words));
    return true;
}

bool Args::processArgs(const Strings & args, bool finish)
{
    if (expectedArgs.empty()) {
        if (!args.empty())
            throw UsageError("unexpected argument '%s'", args.front());
        return true;
    }

    auto & exp = expectedArgs.front();
    bool ready = exp.handler.arity == ArityAny ? finish : args.size() == exp.handler.arity;

    if (ready) {
        exp.handler.fun(std::vector<std::string>(args.begin(), args.end()));
        processedArgs.splice(processedArgs.end(), expectedArgs, expectedArgs.begin());
    }

    if (finish && !expectedArgs.empty() && !expectedArgs.front().optional)
        throw UsageError("more arguments are required");

    return ready;
}

static std::string renderArg(const std::string & label, bool optional, bool many)
{
    auto s = label + (many ? "..." : "");
    return optional ? "[" + s + "]" : "<" + s + ">";
}

void Args::printHelp(const std::string & programName, std::ostream & out)
{
    Table flags;
    for (auto & [name, flag] : longFlags) {
        if (hiddenCategories.count(flag->category))
            continue;
        std::string left = flag->shortName ? std::string("-") + flag->shortName + ", " : "    ";
        left += "--" + name;
        for (auto & label : flag->labels)
            left += " " ANSI_ITALIC + label + ANSI_NORMAL;
        flags.push_back({"  " + left, trim(flag->description)});
    }

    out << ANSI_BOLD "Usage:" ANSI_NORMAL " " << programName;
    if (!longFlags.empty())
        out << " " ANSI_ITALIC "[flags...]" ANSI_NORMAL;
    for (auto * args : {&processedArgs, &expectedArgs})
        for (auto & arg : *args)
            out << " " << renderArg(arg.label, arg.optional, arg.handler.arity == ArityAny);
    out << "\n";

    if (auto s = trim(description()); !s.empty())
        out << "\n" << s << "\n";

    if (!flags.empty()) {
        out << "\n" ANSI_BOLD "Flags:" ANSI_NORMAL "\n";
        printTable(out, flags);
    }

    if (auto s = doc(); !s.empty())
        out << "\n" << stripIndentation(s);
}

Strings argvToStrings(int argc, char ** argv)
{
    return Strings(argv + 1, argv + argc);
}

MultiCommand::MultiCommand(std::string_view commandName, const Commands & commands_)
    : commands(commands_)
    , commandName(commandName)
{
    expectArgs({
        .label = "subcommand",
        .optional = true,
        .handler = {[this](std::string s) {
            auto i = commands.find(s);
            if (i == commands.end()) {
                StringSet names;
                for (auto & [name, _] : commands)
                    names.insert(name);
                throw UsageError(Suggestions::bestMatches(names, s), "'%s' is not a recognised command", s);
            }
            command = {s, i->second()};
        }},
    });
}

bool MultiCommand::processFlag(Strings::iterator & pos, Strings::iterator end)
{
    return Args::processFlag(pos, end) || (command && command->second->processFlag(pos, end));
}

bool MultiCommand::processArgs(const Strings & args, bool finish)
{
    return command ? command->second->processArgs(args, finish) : Args::processArgs(args, finish);
}

void MultiCommand::checkArgs()
{
    if (!command)
        throw UsageError("'%s' requires a sub-command.", commandName);
    command->second->checkArgs();
}

void MultiCommand::printHelp(const std::string & programName, std::ostream & out)
{
    Args::printHelp(programName, out);

    Table table;
    for (auto & [name, makeCommand] : commands)
        table.push_back({"  " + name, trim(makeCommand()->description())});

    out << "\n" ANSI_BOLD "Commands:" ANSI_NORMAL "\n";
    printTable(out, table);
}

} // namespace sdbg

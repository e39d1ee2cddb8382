#include "sdbg/util/args.hh"
#include "sdbg/util/terminal.hh"

#include <gtest/gtest.h>

#include <sstream>

namespace sdbg {

struct TestArgs : virtual Args
{
    int verbosity = 0;
    std::optional<int> pid;
    std::string format;
    std::vector<std::string> rest;

    TestArgs()
    {
        addFlag({
            .longName = "verbose",
            .shortName = 'v',
            .description = "Be more verbose.",
            .handler = {[this]() { verbosity++; }},
        });
        addFlag({
            .longName = "pid",
            .shortName = 'p',
            .description = "Process to attach to.",
            .labels = {"pid"},
            .handler = {&pid},
        });
        addFlag({
            .longName = "log-format",
            .labels = {"format"},
            .handler = {&format},
        });
        addFlag({
            .longName = "history-size",
            .description = "Set the `history-size` setting.",
            .category = "settings",
            .labels = {"value"},
            .handler = {[](std::string) {}},
        });
        hiddenCategories.insert("settings");
        expectArgs({.label = "program", .optional = true, .handler = {&rest}});
    }
};

TEST(Args, noArguments)
{
    TestArgs args;
    args.parseCmdline({});

    ASSERT_EQ(args.verbosity, 0);
    ASSERT_EQ(args.pid, std::nullopt);
    ASSERT_TRUE(args.rest.empty());
}

TEST(Args, compoundShortFlags)
{
    TestArgs args;
    args.parseCmdline({"-vvv"});

    ASSERT_EQ(args.verbosity, 3);
}

TEST(Args, shortFlagWithAttachedValue)
{
    TestArgs args;
    args.parseCmdline({"-p42"});

    ASSERT_EQ(args.pid, 42);
}

TEST(Args, longFlagWithValue)
{
    TestArgs args;
    args.parseCmdline({"--log-format", "internal-json", "--pid", "7"});

    ASSERT_EQ(args.format, "internal-json");
    ASSERT_EQ(args.pid, 7);
}

TEST(Args, dashDashEndsFlags)
{
    TestArgs args;
    args.parseCmdline({"-v", "--", "ls", "-l"});

    std::vector<std::string> expected = {"ls", "-l"};
    ASSERT_EQ(args.verbosity, 1);
    ASSERT_EQ(args.rest, expected);
}

TEST(Args, unknownFlag)
{
    TestArgs args;

    ASSERT_THROW(args.parseCmdline({"--frobnicate"}), UsageError);
}

TEST(Args, missingFlagArgument)
{
    TestArgs args;

    ASSERT_THROW(args.parseCmdline({"--pid"}), UsageError);
}

TEST(Args, nonIntegerFlagArgument)
{
    TestArgs args;

    ASSERT_THROW(args.parseCmdline({"--pid", "abc"}), UsageError);
}

TEST(Args, printHelpShowsVisibleFlags)
{
    TestArgs args;
    std::ostringstream out;
    args.printHelp("stupid-dbg", out);
    auto help = filterANSIEscapes(out.str(), true);

    ASSERT_NE(help.find("Usage: stupid-dbg [flags...] [program...]"), std::string::npos);
    ASSERT_NE(help.find("-p, --pid pid"), std::string::npos);
    ASSERT_NE(help.find("Process to attach to."), std::string::npos);
    ASSERT_EQ(help.find("--history-size"), std::string::npos);
}

TEST(Args, hiddenFlagsStillWork)
{
    TestArgs args;

    ASSERT_NO_THROW(args.parseCmdline({"--history-size", "10"}));
}

struct CmdEcho : Command
{
    std::string word;
    std::string * out;

    CmdEcho(std::string * out)
        : out(out)
    {
        expectArg("word", &word);
    }

    std::string description() override
    {
        return "repeat a word";
    }

    void run() override
    {
        *out = word;
    }
};

struct TestMultiCommand : MultiCommand
{
    std::string output;

    TestMultiCommand()
        : MultiCommand(
              "test",
              {
                  {"echo", [this]() { return std::make_shared<CmdEcho>(&output); }},
                  {"status", [this]() { return std::make_shared<CmdEcho>(&output); }},
              })
    {
    }
};

TEST(MultiCommand, selectsSubcommand)
{
    TestMultiCommand root;
    root.parseCmdline({"echo", "hello"});

    ASSERT_TRUE(root.command);
    ASSERT_EQ(root.command->first, "echo");
    root.command->second->run();
    ASSERT_EQ(root.output, "hello");
}

TEST(MultiCommand, unknownCommandHasSuggestions)
{
    TestMultiCommand root;

    try {
        root.parseCmdline({"ecko", "hello"});
        FAIL() << "expected a UsageError";
    } catch (UsageError & e) {
        ASSERT_NE(e.info().suggestions.suggestions.size(), 0u);
        ASSERT_EQ(e.info().suggestions.suggestions.begin()->suggestion, "echo");
    }
}

TEST(MultiCommand, missingSubcommand)
{
    TestMultiCommand root;

    ASSERT_THROW(root.parseCmdline({}), UsageError);
}

TEST(MultiCommand, missingSubcommandArgument)
{
    TestMultiCommand root;

    ASSERT_THROW(root.parseCmdline({"echo"}), UsageError);
}

TEST(MultiCommand, tooManyArguments)
{
    TestMultiCommand root;

    ASSERT_THROW(root.parseCmdline({"echo", "a", "b"}), UsageError);
}

TEST(MultiCommand, printHelpListsCommands)
{
    TestMultiCommand root;
    std::ostringstream out;
    root.printHelp("test", out);

    ASSERT_NE(out.str().find("echo"), std::string::npos);
    ASSERT_NE(out.str().find("repeat a word"), std::string::npos);
}

} // namespace sdbg

#include "sdbg/cmd/debugger.hh"
#include "sdbg/dbg/globals.hh"
#include "sdbg/dbg/tests/test-process.hh"
#include "sdbg/util/logging.hh"
#include "sdbg/util/terminal.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <deque>

namespace sdbg {

using namespace sdbg::testing;
using ::testing::HasSubstr;

/**
 * Records everything logged or printed, with colours removed.
 */
class CapturingLogger : public Logger
{
public:
    std::vector<std::string> messages;
    std::vector<std::string> errors;
    std::vector<std::string> output;
    unsigned int pauses = 0;

    void log(Verbosity lvl, std::string_view s) override
    {
        messages.push_back(filterANSIEscapes(s, true));
    }

    void logEI(const ErrorInfo & ei) override
    {
        errors.push_back(filterANSIEscapes(ei.msg.str(), true));
    }

    void writeToStdout(std::string_view s) override
    {
        output.push_back(std::string(s));
    }

    void pause() override
    {
        pauses++;
    }
};

/**
 * Feeds a fixed list of lines to the REPL, then reports `last`.
 */
class ScriptedInteracter : public ReplInteracter
{
public:
    std::deque<std::string> lines;
    ReplInput last;
    std::vector<std::string> prompts;
    bool initialised = false;
    bool finished = false;

    ScriptedInteracter(std::deque<std::string> lines, ReplInput last = ReplInput::EndOfFile)
        : lines(std::move(lines))
        , last(last)
    {
    }

    Guard init(ReplCompleter * repl) override
    {
        initialised = true;
        return Guard([this]() { finished = true; });
    }

    ReplInput getLine(std::string & input, const std::string & prompt) override
    {
        prompts.push_back(prompt);
        if (lines.empty())
            return last;
        input = lines.front();
        lines.pop_front();
        return ReplInput::Line;
    }
};

class DebuggerTest : public ::testing::Test
{
protected:
    std::unique_ptr<Logger> savedLogger;
    CapturingLogger * capture = nullptr;
    Debugger debugger;

    void SetUp() override
    {
        auto l = std::make_unique<CapturingLogger>();
        capture = l.get();
        savedLogger = std::exchange(logger, std::move(l));
    }

    void TearDown() override
    {
        /* Detach before the capturing logger goes away. */
        debugger.detach();
        logger = std::move(savedLogger);
    }

    bool warned(const std::string & text)
    {
        for (auto & m : capture->messages)
            if (m.find(text) != std::string::npos)
                return true;
        return false;
    }
};

TEST_F(DebuggerTest, emptyLineDoesNothing)
{
    ASSERT_FALSE(debugger.executeLine("").quit);
    ASSERT_FALSE(debugger.executeLine("   \t").quit);
    ASSERT_TRUE(capture->output.empty());
}

TEST_F(DebuggerTest, quit)
{
    ASSERT_TRUE(debugger.executeLine("quit").quit);
    ASSERT_TRUE(debugger.executeLine("q").quit);
}

TEST_F(DebuggerTest, unknownCommandSuggestsAlternatives)
{
    try {
        debugger.executeLine("detahc");
        FAIL() << "expected a UsageError";
    } catch (UsageError & e) {
        ASSERT_THAT(filterANSIEscapes(e.message(), true), HasSubstr("'detahc' is not a recognised command"));
        ASSERT_THAT(e.info().suggestions.to_string(), HasSubstr("detach"));
    }
}

TEST_F(DebuggerTest, invalidArguments)
{
    ASSERT_THROW(debugger.executeLine("attach"), UsageError);
    ASSERT_THROW(debugger.executeLine("attach notapid"), UsageError);
    ASSERT_THROW(debugger.executeLine("attach 1 2"), UsageError);
    ASSERT_THROW(debugger.executeLine("register"), UsageError);
    ASSERT_THROW(debugger.executeLine("detach --frob"), UsageError);
}

TEST_F(DebuggerTest, unbalancedQuotes)
{
    ASSERT_THROW(debugger.executeLine("run 'foo"), Error);
}

TEST_F(DebuggerTest, commandsWithoutDebuggeeWarn)
{
    debugger.executeLine("detach");
    debugger.executeLine("continue");
    debugger.executeLine("c");
    debugger.executeLine("status");

    ASSERT_EQ(capture->messages.size(), 4u);
    for (auto & m : capture->messages)
        ASSERT_THAT(m, HasSubstr("no debuggee, do nothing"));
}

TEST_F(DebuggerTest, registersNeedDebuggee)
{
    try {
        debugger.executeLine("register read");
        FAIL() << "expected an Error";
    } catch (Error & e) {
        ASSERT_THAT(e.message(), HasSubstr("no debuggee"));
    }
    ASSERT_THROW(debugger.executeLine("register write rax 1"), Error);
}

TEST_F(DebuggerTest, runWithoutProgram)
{
    ASSERT_THROW(debugger.run({}), Error);
    ASSERT_EQ(debugger.currentDebuggee(), nullptr);
}

TEST_F(DebuggerTest, runAndDetach)
{
    debugger.executeLine("run " + programRunningEndlessly());
    auto * debuggee = debugger.currentDebuggee();
    ASSERT_NE(debuggee, nullptr);
    auto pid = debuggee->pid();
    ASSERT_TRUE(processExists(pid));

    debugger.executeLine("status");
    ASSERT_EQ(capture->output.back(), fmt("process %d: stopped with signal: SIGTRAP", pid));

    debugger.executeLine("detach");
    ASSERT_EQ(debugger.currentDebuggee(), nullptr);
    ASSERT_FALSE(processExists(pid));
}

TEST_F(DebuggerTest, secondDebuggeeIsRefused)
{
    debugger.executeLine("run " + programRunningEndlessly());
    auto pid = debugger.currentDebuggee()->pid();

    debugger.executeLine("run " + programRunningEndlessly());
    debugger.executeLine("attach 1");

    ASSERT_EQ(debugger.currentDebuggee()->pid(), pid);
    ASSERT_TRUE(warned("use `detach` to detach from the current debuggee first"));
}

TEST_F(DebuggerTest, continueUntilExit)
{
    debugger.executeLine("run " + programExitingImmediately());
    auto pid = debugger.currentDebuggee()->pid();

    debugger.executeLine("continue");
    ASSERT_EQ(capture->output.back(), fmt("process %d: exited with status code: 0", pid));

    ASSERT_THROW(debugger.executeLine("c"), Error);
}

TEST_F(DebuggerTest, readAndWriteRegisters)
{
    debugger.executeLine("run " + programRunningEndlessly());

    debugger.executeLine("register write r12 0x2a");
    debugger.executeLine("register read r12 r12d");
    ASSERT_THAT(capture->output.back(), HasSubstr("0x000000000000002a"));
    ASSERT_THAT(capture->output.back(), HasSubstr("r12d"));

    debugger.executeLine("register read");
    ASSERT_THAT(capture->output.back(), HasSubstr("rip"));
    ASSERT_THAT(capture->output.back(), ::testing::Not(HasSubstr("xmm0")));

    debugger.executeLine("register read --all");
    ASSERT_THAT(capture->output.back(), HasSubstr("xmm0"));
    ASSERT_THAT(capture->output.back(), HasSubstr("dr7"));
}

TEST_F(DebuggerTest, writeRegisterRejectsBadValues)
{
    debugger.executeLine("run " + programRunningEndlessly());

    ASSERT_THROW(debugger.executeLine("register write al 256"), UsageError);
    ASSERT_THROW(debugger.executeLine("register write rxa 1"), Error);
    ASSERT_THROW(debugger.executeLine("register read nosuchreg"), Error);
}

TEST_F(DebuggerTest, registersOfRunningDebuggee)
{
    debugger.executeLine("run " + programRunningEndlessly());
    debugger.currentDebuggee()->resume();

    try {
        debugger.executeLine("register read");
        FAIL() << "expected an Error";
    } catch (Error & e) {
        ASSERT_THAT(e.message(), HasSubstr("not stopped"));
    }
}

TEST_F(DebuggerTest, help)
{
    debugger.executeLine("help");
    ASSERT_THAT(capture->output.back(), HasSubstr("Commands:"));
    ASSERT_THAT(capture->output.back(), HasSubstr("attach"));
    ASSERT_THAT(capture->output.back(), HasSubstr("register"));

    debugger.executeLine("help c");
    ASSERT_THAT(capture->output.back(), HasSubstr("continue"));

    ASSERT_THROW(debugger.executeLine("help frobnicate"), UsageError);
}

TEST_F(DebuggerTest, replRunsUntilQuit)
{
    ScriptedInteracter interacter({"status", "quit", "status"});
    debugger.repl(interacter);

    ASSERT_TRUE(interacter.initialised);
    ASSERT_TRUE(interacter.finished);
    ASSERT_EQ(interacter.prompts.size(), 2u);
    ASSERT_EQ(interacter.prompts.front(), settings.prompt.get());
    ASSERT_EQ(interacter.lines.size(), 1u);
    ASSERT_EQ(capture->pauses, 2u);
}

TEST_F(DebuggerTest, replStopsAtEndOfFile)
{
    ScriptedInteracter interacter({""}, ReplInput::EndOfFile);
    debugger.repl(interacter);

    ASSERT_TRUE(warned("ctrl-d"));
}

TEST_F(DebuggerTest, replStopsWhenInterrupted)
{
    ScriptedInteracter interacter({}, ReplInput::Interrupted);
    debugger.repl(interacter);

    ASSERT_TRUE(warned("ctrl-c"));
}

TEST_F(DebuggerTest, replLogsFailedCommands)
{
    ScriptedInteracter interacter({"frobnicate", "register read", "quit"});
    debugger.repl(interacter);

    ASSERT_EQ(capture->errors.size(), 2u);
    ASSERT_THAT(capture->errors[0], HasSubstr("failed to execute command: 'frobnicate' is not a recognised command"));
    ASSERT_THAT(capture->errors[1], HasSubstr("failed to execute command: no debuggee"));
}

TEST_F(DebuggerTest, completeCommandNames)
{
    ASSERT_EQ(debugger.completeLine("de"), StringSet({"detach"}));
    ASSERT_EQ(debugger.completeLine("q"), StringSet({"q", "quit"}));
    ASSERT_EQ(debugger.completeLine(""), Debugger::commandNames());
    ASSERT_EQ(debugger.completeLine("help re"), StringSet({"register"}));
}

TEST_F(DebuggerTest, completeRegisterArguments)
{
    ASSERT_EQ(debugger.completeLine("register "), StringSet({"read", "write"}));
    ASSERT_EQ(debugger.completeLine("register w"), StringSet({"write"}));
    ASSERT_EQ(debugger.completeLine("register read rs"), StringSet({"rsi", "rsp"}));
    ASSERT_EQ(debugger.completeLine("register read --"), StringSet({"--all"}));
    ASSERT_EQ(debugger.completeLine("register write xmm1"), StringSet({"xmm1", "xmm10", "xmm11", "xmm12", "xmm13", "xmm14", "xmm15"}));
    ASSERT_TRUE(debugger.completeLine("register write rax ").empty());
    ASSERT_TRUE(debugger.completeLine("attach ").empty());
}

} // namespace sdbg

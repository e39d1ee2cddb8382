#include "sdbg/cmd/repl-interacter.hh"
#include "sdbg/util/error.hh"
#include "sdbg/util/file-system.hh"
#include "sdbg/util/logging.hh"
#include "sdbg/util/signals.hh"

#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <readline/history.h>
#include <readline/readline.h>

#include <unistd.h>

namespace sdbg {

/* readline's callbacks are plain functions, so the session state is
   global. */
static ReplCompleter * activeCompleter = nullptr;
static StringSet candidates;
static StringSet::const_iterator nextCandidate;

static char * generateCandidate(const char *, int state)
{
    if (state == 0) {
        try {
            candidates = activeCompleter->completeLine(std::string(rl_line_buffer, rl_point));
        } catch (Error & e) {
            candidates.clear();
            debug("completion failed: %s", e.msg());
        }
        nextCandidate = candidates.cbegin();
    }

    if (nextCandidate == candidates.cend())
        return nullptr;

    /* readline takes ownership and frees with free(). */
    auto * copy = strdup((nextCandidate++)->c_str());
    if (!copy)
        throw Error("out of memory while completing");
    return copy;
}

static char ** complete(const char * text, int, int)
{
    /* No file name completion. */
    rl_attempted_completion_over = 1;
    return rl_completion_matches(text, generateCandidate);
}

/**
 * Like `rl_getc()`, but a read interrupted by Ctrl-C ends the line
 * instead of being retried.
 */
static int getcUnlessInterrupted(FILE * stream)
{
    while (!isInterrupted()) {
        unsigned char c;
        switch (read(fileno(stream), &c, 1)) {
        case 1:
            return c;
        case 0:
            return EOF;
        default:
            if (errno != EINTR)
                return EOF;
        }
    }
    return EOF;
}

ReadlineInteracter::Guard ReadlineInteracter::init(ReplCompleter * completer)
{
    /* Makes `$if stupid-dbg` work in ~/.inputrc. */
    rl_readline_name = "stupid-dbg";
    rl_catch_signals = 0;
    rl_getc_function = getcUnlessInterrupted;
    rl_attempted_completion_function = complete;

    if (historyFile) {
        try {
            createDirs(dirOf(*historyFile));
        } catch (SystemError & e) {
            logWarning(e.info());
        }
        stifle_history(historySize);
        if (auto err = read_history(historyFile->c_str()); err && err != ENOENT)
            warn("unable to load history file '%s': %s", *historyFile, strerror(err));
    }

    auto previous = activeCompleter;
    activeCompleter = completer;
    return Guard([previous]() { activeCompleter = previous; });
}

ReplInput ReadlineInteracter::getLine(std::string & input, const std::string & prompt)
{
    char * line;
    {
        ReceiveInterrupts receiveInterrupts;
        line = readline(prompt.c_str());
    }
    Finally freeLine([line]() { free(line); });

    if (isInterrupted()) {
        setInterrupted(false);
        input.clear();
        return ReplInput::Interrupted;
    }

    if (!line)
        return ReplInput::EndOfFile;

    input = line;
    if (!input.empty())
        add_history(line);
    return ReplInput::Line;
}

ReadlineInteracter::~ReadlineInteracter()
{
    if (historyFile)
        if (auto err = write_history(historyFile->c_str()))
            warn("unable to save history file '%s': %s", *historyFile, strerror(err));
}

} // namespace sdbg

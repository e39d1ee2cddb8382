#include "sdbg/util/error.hh"
#include "sdbg/util/exit.hh"
#include "sdbg/util/logging.hh"
#include "sdbg/util/strings.hh"
#include "sdbg/util/terminal.hh"

#include <exception>
#include <sstream>

namespace sdbg {

Exit::~Exit() {}

const std::string & BaseError::calcWhat() const
{
    if (!what_) {
        std::ostringstream out;
        showErrorInfo(out, err);
        what_ = out.str();
    }
    return *what_;
}

static const char * levelPrefix(Verbosity level)
{
    switch (level) {
    case lvlError:
        return ANSI_RED "error:" ANSI_NORMAL " ";
    case lvlWarn:
        return ANSI_WARNING "warning:" ANSI_NORMAL " ";
    case lvlInfo:
    case lvlTalkative:
        return ANSI_GREEN "info:" ANSI_NORMAL " ";
    case lvlDebug:
    case lvlVomit:
        return ANSI_BLUE "debug:" ANSI_NORMAL " ";
    }
    unreachable();
}

std::ostream & showErrorInfo(std::ostream & out, const ErrorInfo & info)
{
    auto text = info.msg.str();

    auto suggestions = info.suggestions.trim();
    if (!suggestions.suggestions.empty())
        text += "\nDid you mean " + suggestions.to_string() + "?";

    /* Continuation lines line up with the first character after the
       prefix. */
    std::string prefix = levelPrefix(info.level);
    std::string margin(filterANSIEscapes(prefix, true).size(), ' ');

    out << prefix;
    for (char c : chomp(text)) {
        out << c;
        if (c == '\n')
            out << margin;
    }
    return out;
}

void ignoreExceptionInDestructor(Verbosity lvl)
{
    try {
        throw;
    } catch (Error & e) {
        printMsg(lvl, ANSI_RED "error (ignored):" ANSI_NORMAL " %s", e.message());
    } catch (std::exception & e) {
        printMsg(lvl, ANSI_RED "error (ignored):" ANSI_NORMAL " %s", e.what());
    }
}

void unreachable(std::source_location loc)
{
    writeToStderr(
        fmt(ANSI_RED "error (internal):" ANSI_NORMAL " unexpected condition in %s at %s:%d\n",
            loc.function_name(),
            loc.file_name(),
            loc.line()));
    std::terminate();
}

} // namespace sdbg

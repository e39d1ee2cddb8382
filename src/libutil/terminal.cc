#include "sdbg/util/terminal.hh"
#include "sdbg/util/environment-variables.hh"

#include <unistd.h>

namespace sdbg {

bool isTTY()
{
    static const bool tty = [] {
        if (!isatty(STDERR_FILENO) || getEnv("TERM").value_or("dumb") == "dumb")
            return false;
        return !getEnv("NO_COLOR") && !getEnv("NOCOLOR");
    }();
    return tty;
}

std::string filterANSIEscapes(std::string_view s, bool filterAll)
{
    std::string res;

    for (size_t i = 0; i < s.size();) {
        if (s[i] != '\e') {
            if (s[i] != '\r' && s[i] != '\a')
                res += s[i];
            i++;
            continue;
        }

        /* A CSI sequence is ESC '[', parameter bytes 0x30-0x3f,
           intermediate bytes 0x20-0x2f and a final byte 0x40-0x7e.
           Any other escape is ESC and one byte 0x40-0x5f. */
        auto start = i++;
        bool sgr = false;
        auto in = [&](char lo, char hi) { return i < s.size() && s[i] >= lo && s[i] <= hi; };
        if (i < s.size() && s[i] == '[') {
            i++;
            while (in(0x30, 0x3f))
                i++;
            while (in(0x20, 0x2f))
                i++;
            if (in(0x40, 0x7e))
                sgr = s[i++] == 'm';
        } else if (in(0x40, 0x5f))
            i++;

        if (sgr && !filterAll)
            res += s.substr(start, i - start);
    }

    return res;
}

} // namespace sdbg

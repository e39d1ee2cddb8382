#pragma once
///@file

#include "sdbg/util/error.hh"

#include <string>
#include <string_view>

#include <unistd.h>

namespace sdbg {

using Descriptor = int;

const Descriptor INVALID_DESCRIPTOR = -1;

inline Descriptor getStandardOutput()
{
    return STDOUT_FILENO;
}

inline Descriptor getStandardError()
{
    return STDERR_FILENO;
}

/**
 * Read from `fd` until end of file.
 */
std::string drainFD(Descriptor fd);

/**
 * Write all of `s` to `fd`, retrying after short writes and `EINTR`.
 * With `allowInterrupts`, a pending Ctrl-C aborts the write with
 * `Interrupted`.
 */
void writeFull(Descriptor fd, std::string_view s, bool allowInterrupts = true);

/**
 * Write `s` and a newline with a single `writeFull()`.
 */
void writeLine(Descriptor fd, std::string s);

/**
 * Owner of a file descriptor, which is closed on destruction.
 */
class AutoCloseFD
{
    Descriptor fd = INVALID_DESCRIPTOR;

public:

    AutoCloseFD() = default;

    AutoCloseFD(Descriptor fd)
        : fd(fd)
    {
    }

    AutoCloseFD(const AutoCloseFD &) = delete;

    AutoCloseFD(AutoCloseFD && that) noexcept
        : fd(that.release())
    {
    }

    AutoCloseFD & operator=(AutoCloseFD && that);

    ~AutoCloseFD();

    Descriptor get() const
    {
        return fd;
    }

    explicit operator bool() const
    {
        return fd != INVALID_DESCRIPTOR;
    }

    /**
     * Give up ownership without closing.
     */
    Descriptor release();

    void close();
};

/**
 * Both ends of a pipe, close-on-exec.
 */
struct Pipe
{
    AutoCloseFD readSide, writeSide;

    void create();
};

} // namespace sdbg

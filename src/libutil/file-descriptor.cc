#include "sdbg/util/file-descriptor.hh"
#include "sdbg/util/signals.hh"

#include <array>

#include <fcntl.h>

namespace sdbg {

std::string drainFD(Descriptor fd)
{
    std::string res;
    std::array<char, 16 * 1024> buf;

    while (true) {
        checkInterrupt();
        auto n = read(fd, buf.data(), buf.size());
        if (n == 0)
            return res;
        if (n == -1) {
            if (errno == EINTR)
                continue;
            throw SysError("reading from file descriptor %d", fd);
        }
        res.append(buf.data(), n);
    }
}

void writeFull(Descriptor fd, std::string_view s, bool allowInterrupts)
{
    while (!s.empty()) {
        if (allowInterrupts)
            checkInterrupt();
        auto n = write(fd, s.data(), s.size());
        if (n == -1) {
            if (errno == EINTR)
                continue;
            throw SysError("writing to file descriptor %d", fd);
        }
        s.remove_prefix(n);
    }
}

void writeLine(Descriptor fd, std::string s)
{
    s += '\n';
    writeFull(fd, s);
}

AutoCloseFD & AutoCloseFD::operator=(AutoCloseFD && that)
{
    if (this != &that) {
        close();
        fd = that.release();
    }
    return *this;
}

AutoCloseFD::~AutoCloseFD()
{
    try {
        close();
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

Descriptor AutoCloseFD::release()
{
    auto res = fd;
    fd = INVALID_DESCRIPTOR;
    return res;
}

void AutoCloseFD::close()
{
    if (fd == INVALID_DESCRIPTOR)
        return;
    auto old = release();
    if (::close(old) == -1)
        throw SysError("closing file descriptor %d", old);
}

void Pipe::create()
{
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) == -1)
        throw SysError("creating pipe");
    readSide = fds[0];
    writeSide = fds[1];
}

} // namespace sdbg

#include "sdbg/dbg/ptrace.hh"
#include "sdbg/util/error.hh"
#include "sdbg/util/logging.hh"

#include <cerrno>

#include <sys/ptrace.h>

namespace sdbg::ptrace {

void traceMe()
{
    if (::ptrace(PTRACE_TRACEME, 0, nullptr, nullptr) == -1)
        throw SysError("ptrace(PTRACE_TRACEME)");
}

void attach(pid_t pid)
{
    vomit("ptrace(PTRACE_ATTACH, %d)", pid);
    if (::ptrace(PTRACE_ATTACH, pid, nullptr, nullptr) == -1)
        throw SysError("ptrace(PTRACE_ATTACH) on process %d", pid);
}

void detach(pid_t pid, int sig)
{
    vomit("ptrace(PTRACE_DETACH, %d, %d)", pid, sig);
    if (::ptrace(PTRACE_DETACH, pid, nullptr, (void *) (intptr_t) sig) == -1)
        throw SysError("ptrace(PTRACE_DETACH) on process %d", pid);
}

void cont(pid_t pid, int sig)
{
    vomit("ptrace(PTRACE_CONT, %d, %d)", pid, sig);
    if (::ptrace(PTRACE_CONT, pid, nullptr, (void *) (intptr_t) sig) == -1)
        throw SysError("ptrace(PTRACE_CONT) on process %d", pid);
}

struct user_regs_struct getRegs(pid_t pid)
{
    struct user_regs_struct regs;
    if (::ptrace(PTRACE_GETREGS, pid, nullptr, &regs) == -1)
        throw SysError("ptrace(PTRACE_GETREGS) on process %d", pid);
    return regs;
}

void setRegs(pid_t pid, const struct user_regs_struct & regs)
{
    if (::ptrace(PTRACE_SETREGS, pid, nullptr, &regs) == -1)
        throw SysError("ptrace(PTRACE_SETREGS) on process %d", pid);
}

struct user_fpregs_struct getFpRegs(pid_t pid)
{
    struct user_fpregs_struct fpregs;
    if (::ptrace(PTRACE_GETFPREGS, pid, nullptr, &fpregs) == -1)
        throw SysError("ptrace(PTRACE_GETFPREGS) on process %d", pid);
    return fpregs;
}

void setFpRegs(pid_t pid, const struct user_fpregs_struct & fpregs)
{
    if (::ptrace(PTRACE_SETFPREGS, pid, nullptr, &fpregs) == -1)
        throw SysError("ptrace(PTRACE_SETFPREGS) on process %d", pid);
}

uint64_t peekUser(pid_t pid, size_t offset)
{
    /* PTRACE_PEEKUSER returns the word itself, so -1 is only an error
       if errno says so. */
    errno = 0;
    auto word = ::ptrace(PTRACE_PEEKUSER, pid, (void *) offset, nullptr);
    if (word == -1 && errno != 0)
        throw SysError("ptrace(PTRACE_PEEKUSER) at offset %d on process %d", offset, pid);
    return (uint64_t) word;
}

void pokeUser(pid_t pid, size_t offset, uint64_t word)
{
    if (::ptrace(PTRACE_POKEUSER, pid, (void *) offset, (void *) word) == -1)
        throw SysError("ptrace(PTRACE_POKEUSER) at offset %d on process %d", offset, pid);
}

} // namespace sdbg::ptrace

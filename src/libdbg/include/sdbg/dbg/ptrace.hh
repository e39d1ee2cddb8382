#pragma once
/**
 * @file
 *
 * Wrappers around ptrace(2) that throw `SysError` on failure.
 */

#include <cstdint>
#include <cstddef>

#include <sys/types.h>
#include <sys/user.h>

namespace sdbg::ptrace {

/**
 * Called in a freshly forked child: make the parent its tracer.
 */
void traceMe();

void attach(pid_t pid);

/**
 * Detach from `pid`, delivering `sig` (0 for none) as it resumes.
 */
void detach(pid_t pid, int sig = 0);

/**
 * Resume a stopped tracee, delivering `sig` (0 for none).
 */
void cont(pid_t pid, int sig = 0);

struct user_regs_struct getRegs(pid_t pid);

void setRegs(pid_t pid, const struct user_regs_struct & regs);

struct user_fpregs_struct getFpRegs(pid_t pid);

void setFpRegs(pid_t pid, const struct user_fpregs_struct & fpregs);

/**
 * Read the word at byte `offset` of the tracee's `struct user`.
 */
uint64_t peekUser(pid_t pid, size_t offset);

void pokeUser(pid_t pid, size_t offset, uint64_t word);

} // namespace sdbg::ptrace

#pragma once
///@file

#include "sdbg/dbg/register-value.hh"

#include <sys/types.h>
#include <sys/user.h>

namespace sdbg {

/**
 * A snapshot of the registers of a stopped tracee. Writes are
 * committed to the tracee first and then reflected in the snapshot.
 */
class Registers
{
    pid_t pid;

    struct user data;

    Registers(pid_t pid);

    /**
     * Push the part of `updated` that holds register `info` into the
     * tracee. `data` is only replaced once this succeeded, so it never
     * holds a value the kernel rejected.
     */
    void commit(const RegisterInfo & info, const struct user & updated);

public:

    /**
     * Fetch the general purpose, floating point and debug registers of
     * the stopped tracee `pid`.
     */
    static Registers readWithPtrace(pid_t pid);

    RegisterValue read(RegisterId id) const;

    /**
     * Write a value that is exactly as wide as the register.
     */
    void write(RegisterId id, const RegisterValue & value);

    /**
     * Write a value no wider than the register, widening it as
     * `writeAnyToUser()` does.
     */
    void writeAny(RegisterId id, const RegisterValue & value);

    const struct user & raw() const
    {
        return data;
    }
};

} // namespace sdbg

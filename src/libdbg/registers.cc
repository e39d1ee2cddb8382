#include "sdbg/dbg/registers.hh"
#include "sdbg/dbg/ptrace.hh"
#include "sdbg/util/logging.hh"

#include <cstring>

namespace sdbg {

Registers::Registers(pid_t pid)
    : pid(pid)
{
    std::memset(&data, 0, sizeof(data));
}

Registers Registers::readWithPtrace(pid_t pid)
{
    Activity act(*logger, lvlDebug, actReadRegisters, fmt("reading registers of process %d", pid));

    Registers regs(pid);
    regs.data.regs = ptrace::getRegs(pid);
    regs.data.i387 = ptrace::getFpRegs(pid);
    for (int i = 0; i < 8; ++i)
        regs.data.u_debugreg[i] = ptrace::peekUser(pid, offsetof(struct user, u_debugreg) + i * 8);
    return regs;
}

RegisterValue Registers::read(RegisterId id) const
{
    return readFromUser(registerInfo(id), data);
}

void Registers::write(RegisterId id, const RegisterValue & value)
{
    auto & info = registerInfo(id);
    auto updated = data;
    writeToUser(info, updated, value);
    commit(info, updated);
    data = updated;
}

void Registers::writeAny(RegisterId id, const RegisterValue & value)
{
    auto & info = registerInfo(id);
    auto updated = data;
    writeAnyToUser(info, updated, value);
    commit(info, updated);
    data = updated;
}

void Registers::commit(const RegisterInfo & info, const struct user & updated)
{
    Activity act(
        *logger, lvlDebug, actWriteRegisters, fmt("writing register '%s' of process %d", info.name, pid));

    if (info.kind == RegisterKind::FloatingPoint) {
        ptrace::setFpRegs(pid, updated.i387);
        return;
    }

    /* The register may be a sub-register that does not start on a
       word boundary, so poke the whole word that contains it. */
    auto aligned = info.offset & ~(sizeof(uint64_t) - 1);
    uint64_t word;
    std::memcpy(&word, reinterpret_cast<const uint8_t *>(&updated) + aligned, sizeof(word));
    ptrace::pokeUser(pid, aligned, word);
}

} // namespace sdbg

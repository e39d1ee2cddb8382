#pragma once
/**
 * @file
 *
 * @brief The catalogue of x86-64 registers visible through ptrace.
 *
 * Every register is described by a `RegisterInfo` giving its position
 * and width inside the tracee's `struct user` (see `<sys/user.h>`), so
 * that reading or writing a register is a matter of copying bytes at
 * that offset.
 */

#include "sdbg/util/suggestions.hh"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace sdbg {

enum struct RegisterKind : uint8_t {
    GeneralPurpose,
    /**
     * A narrower view (e.g. `eax`, `ah`) on a 64-bit general purpose
     * register.
     */
    SubGeneralPurpose,
    FloatingPoint,
    Debug,
};

/**
 * How the bytes of a register are interpreted.
 */
enum struct RegisterRepr : uint8_t {
    UInt,
    LongDouble,
    Vector,
};

enum struct RegisterId : uint8_t {
    // 64-bit general purpose registers
    Rax,
    Rdx,
    Rcx,
    Rbx,
    Rsi,
    Rdi,
    Rbp,
    Rsp,
    R8,
    R9,
    R10,
    R11,
    R12,
    R13,
    R14,
    R15,
    Rip,
    Eflags,
    Es,
    Cs,
    Ss,
    Ds,
    Fs,
    Gs,
    FsBase,
    GsBase,
    OrigRax,

    // 32-bit
    Eax,
    Edx,
    Ecx,
    Ebx,
    Esi,
    Edi,
    Ebp,
    Esp,
    R8d,
    R9d,
    R10d,
    R11d,
    R12d,
    R13d,
    R14d,
    R15d,

    // 16-bit
    Ax,
    Dx,
    Cx,
    Bx,
    Si,
    Di,
    Bp,
    Sp,
    R8w,
    R9w,
    R10w,
    R11w,
    R12w,
    R13w,
    R14w,
    R15w,

    // low 8-bit
    Al,
    Dl,
    Cl,
    Bl,
    Sil,
    Dil,
    Bpl,
    Spl,
    R8b,
    R9b,
    R10b,
    R11b,
    R12b,
    R13b,
    R14b,
    R15b,

    // high 8-bit
    Ah,
    Bh,
    Ch,
    Dh,

    // x87 and SSE control
    Fcw,
    Fsw,
    Ftw,
    Fop,
    Frip,
    Frdp,
    Mxcsr,
    Mxcsrmask,

    St0,
    St1,
    St2,
    St3,
    St4,
    St5,
    St6,
    St7,

    Mm0,
    Mm1,
    Mm2,
    Mm3,
    Mm4,
    Mm5,
    Mm6,
    Mm7,

    Xmm0,
    Xmm1,
    Xmm2,
    Xmm3,
    Xmm4,
    Xmm5,
    Xmm6,
    Xmm7,
    Xmm8,
    Xmm9,
    Xmm10,
    Xmm11,
    Xmm12,
    Xmm13,
    Xmm14,
    Xmm15,

    Dr0,
    Dr1,
    Dr2,
    Dr3,
    Dr4,
    Dr5,
    Dr6,
    Dr7,
};

struct RegisterInfo
{
    RegisterId id;
    std::string_view name;

    /**
     * Register number in the System V x86-64 DWARF mapping, if it has
     * one.
     */
    std::optional<unsigned int> dwarfId;

    RegisterKind kind;
    RegisterRepr repr;
    size_t byteWidth;

    /**
     * Byte offset of the register inside `struct user`.
     */
    size_t offset;
};

/**
 * All registers, ordered by `RegisterId`.
 */
std::span<const RegisterInfo> allRegisters();

const RegisterInfo & registerInfo(RegisterId id);

/**
 * Look up a register by name (e.g. `rax`, `xmm3`), or return the
 * closest names if there is none.
 */
OrSuggestions<RegisterId> lookupRegister(std::string_view name);

/**
 * Like `lookupRegister()`, but throws a `UsageError` carrying the
 * suggestions when `name` is unknown.
 */
const RegisterInfo & registerInfoByName(std::string_view name);

/**
 * @return The register with the given DWARF number, or `nullptr`.
 */
const RegisterInfo * registerInfoByDwarf(unsigned int dwarfId);

std::string_view showRegisterKind(RegisterKind kind);

} // namespace sdbg

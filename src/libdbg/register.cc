#include "sdbg/dbg/register.hh"
#include "sdbg/util/error.hh"

#include <array>
#include <cstddef>

#include <sys/user.h>

namespace sdbg {

#define USER_OFFSET(field) offsetof(struct user, field)
#define GPR_OFFSET(field) (USER_OFFSET(regs) + offsetof(struct user_regs_struct, field))
#define FPR_OFFSET(field) (USER_OFFSET(i387) + offsetof(struct user_fpregs_struct, field))

#define GPR_64(id, name, dwarf) \
    {RegisterId::id, #name, dwarf, RegisterKind::GeneralPurpose, RegisterRepr::UInt, 8, GPR_OFFSET(name)}

#define GPR_SUB(id, name, base, width, offsetOnBase) \
    {RegisterId::id,                                 \
     #name,                                          \
     std::nullopt,                                   \
     RegisterKind::SubGeneralPurpose,                \
     RegisterRepr::UInt,                             \
     width,                                          \
     GPR_OFFSET(base) + offsetOnBase}

#define FPR(id, name, field, dwarf)             \
    {RegisterId::id,                            \
     #name,                                     \
     dwarf,                                     \
     RegisterKind::FloatingPoint,               \
     RegisterRepr::UInt,                        \
     sizeof(user_fpregs_struct::field),         \
     FPR_OFFSET(field)}

#define FP_ST(n)                                \
    {RegisterId::St##n,                         \
     "st" #n,                                   \
     33 + n,                                    \
     RegisterKind::FloatingPoint,               \
     RegisterRepr::LongDouble,                  \
     16,                                        \
     FPR_OFFSET(st_space) + n * 16}

/* The MMX registers alias the low 8 bytes of the x87 stack slots. */
#define FP_MM(n)                                \
    {RegisterId::Mm##n,                         \
     "mm" #n,                                   \
     41 + n,                                    \
     RegisterKind::FloatingPoint,               \
     RegisterRepr::Vector,                      \
     8,                                         \
     FPR_OFFSET(st_space) + n * 16}

#define FP_XMM(n)                               \
    {RegisterId::Xmm##n,                        \
     "xmm" #n,                                  \
     17 + n,                                    \
     RegisterKind::FloatingPoint,               \
     RegisterRepr::Vector,                      \
     16,                                        \
     FPR_OFFSET(xmm_space) + n * 16}

#define DR(n) \
    {RegisterId::Dr##n, "dr" #n, std::nullopt, RegisterKind::Debug, RegisterRepr::UInt, 8, USER_OFFSET(u_debugreg) + n * 8}

static constexpr auto registers = std::to_array<RegisterInfo>({
    GPR_64(Rax, rax, 0),
    GPR_64(Rdx, rdx, 1),
    GPR_64(Rcx, rcx, 2),
    GPR_64(Rbx, rbx, 3),
    GPR_64(Rsi, rsi, 4),
    GPR_64(Rdi, rdi, 5),
    GPR_64(Rbp, rbp, 6),
    GPR_64(Rsp, rsp, 7),
    GPR_64(R8, r8, 8),
    GPR_64(R9, r9, 9),
    GPR_64(R10, r10, 10),
    GPR_64(R11, r11, 11),
    GPR_64(R12, r12, 12),
    GPR_64(R13, r13, 13),
    GPR_64(R14, r14, 14),
    GPR_64(R15, r15, 15),
    GPR_64(Rip, rip, 16),
    GPR_64(Eflags, eflags, 49),
    GPR_64(Es, es, 50),
    GPR_64(Cs, cs, 51),
    GPR_64(Ss, ss, 52),
    GPR_64(Ds, ds, 53),
    GPR_64(Fs, fs, 54),
    GPR_64(Gs, gs, 55),
    GPR_64(FsBase, fs_base, 58),
    GPR_64(GsBase, gs_base, 59),
    GPR_64(OrigRax, orig_rax, std::nullopt),

    GPR_SUB(Eax, eax, rax, 4, 0),
    GPR_SUB(Edx, edx, rdx, 4, 0),
    GPR_SUB(Ecx, ecx, rcx, 4, 0),
    GPR_SUB(Ebx, ebx, rbx, 4, 0),
    GPR_SUB(Esi, esi, rsi, 4, 0),
    GPR_SUB(Edi, edi, rdi, 4, 0),
    GPR_SUB(Ebp, ebp, rbp, 4, 0),
    GPR_SUB(Esp, esp, rsp, 4, 0),
    GPR_SUB(R8d, r8d, r8, 4, 0),
    GPR_SUB(R9d, r9d, r9, 4, 0),
    GPR_SUB(R10d, r10d, r10, 4, 0),
    GPR_SUB(R11d, r11d, r11, 4, 0),
    GPR_SUB(R12d, r12d, r12, 4, 0),
    GPR_SUB(R13d, r13d, r13, 4, 0),
    GPR_SUB(R14d, r14d, r14, 4, 0),
    GPR_SUB(R15d, r15d, r15, 4, 0),

    GPR_SUB(Ax, ax, rax, 2, 0),
    GPR_SUB(Dx, dx, rdx, 2, 0),
    GPR_SUB(Cx, cx, rcx, 2, 0),
    GPR_SUB(Bx, bx, rbx, 2, 0),
    GPR_SUB(Si, si, rsi, 2, 0),
    GPR_SUB(Di, di, rdi, 2, 0),
    GPR_SUB(Bp, bp, rbp, 2, 0),
    GPR_SUB(Sp, sp, rsp, 2, 0),
    GPR_SUB(R8w, r8w, r8, 2, 0),
    GPR_SUB(R9w, r9w, r9, 2, 0),
    GPR_SUB(R10w, r10w, r10, 2, 0),
    GPR_SUB(R11w, r11w, r11, 2, 0),
    GPR_SUB(R12w, r12w, r12, 2, 0),
    GPR_SUB(R13w, r13w, r13, 2, 0),
    GPR_SUB(R14w, r14w, r14, 2, 0),
    GPR_SUB(R15w, r15w, r15, 2, 0),

    GPR_SUB(Al, al, rax, 1, 0),
    GPR_SUB(Dl, dl, rdx, 1, 0),
    GPR_SUB(Cl, cl, rcx, 1, 0),
    GPR_SUB(Bl, bl, rbx, 1, 0),
    GPR_SUB(Sil, sil, rsi, 1, 0),
    GPR_SUB(Dil, dil, rdi, 1, 0),
    GPR_SUB(Bpl, bpl, rbp, 1, 0),
    GPR_SUB(Spl, spl, rsp, 1, 0),
    GPR_SUB(R8b, r8b, r8, 1, 0),
    GPR_SUB(R9b, r9b, r9, 1, 0),
    GPR_SUB(R10b, r10b, r10, 1, 0),
    GPR_SUB(R11b, r11b, r11, 1, 0),
    GPR_SUB(R12b, r12b, r12, 1, 0),
    GPR_SUB(R13b, r13b, r13, 1, 0),
    GPR_SUB(R14b, r14b, r14, 1, 0),
    GPR_SUB(R15b, r15b, r15, 1, 0),

    GPR_SUB(Ah, ah, rax, 1, 1),
    GPR_SUB(Bh, bh, rbx, 1, 1),
    GPR_SUB(Ch, ch, rcx, 1, 1),
    GPR_SUB(Dh, dh, rdx, 1, 1),

    FPR(Fcw, fcw, cwd, 65),
    FPR(Fsw, fsw, swd, 66),
    FPR(Ftw, ftw, ftw, std::nullopt),
    FPR(Fop, fop, fop, std::nullopt),
    FPR(Frip, frip, rip, std::nullopt),
    FPR(Frdp, frdp, rdp, std::nullopt),
    FPR(Mxcsr, mxcsr, mxcsr, 64),
    FPR(Mxcsrmask, mxcsrmask, mxcr_mask, std::nullopt),

    FP_ST(0),
    FP_ST(1),
    FP_ST(2),
    FP_ST(3),
    FP_ST(4),
    FP_ST(5),
    FP_ST(6),
    FP_ST(7),

    FP_MM(0),
    FP_MM(1),
    FP_MM(2),
    FP_MM(3),
    FP_MM(4),
    FP_MM(5),
    FP_MM(6),
    FP_MM(7),

    FP_XMM(0),
    FP_XMM(1),
    FP_XMM(2),
    FP_XMM(3),
    FP_XMM(4),
    FP_XMM(5),
    FP_XMM(6),
    FP_XMM(7),
    FP_XMM(8),
    FP_XMM(9),
    FP_XMM(10),
    FP_XMM(11),
    FP_XMM(12),
    FP_XMM(13),
    FP_XMM(14),
    FP_XMM(15),

    DR(0),
    DR(1),
    DR(2),
    DR(3),
    DR(4),
    DR(5),
    DR(6),
    DR(7),
});

static constexpr bool registersOrderedById()
{
    for (size_t i = 0; i < registers.size(); ++i)
        if ((size_t) registers[i].id != i)
            return false;
    return true;
}

static_assert(registersOrderedById(), "register table must be ordered by RegisterId");
static_assert((size_t) RegisterId::Dr7 + 1 == registers.size());

std::span<const RegisterInfo> allRegisters()
{
    return registers;
}

const RegisterInfo & registerInfo(RegisterId id)
{
    return registers[(size_t) id];
}

OrSuggestions<RegisterId> lookupRegister(std::string_view name)
{
    for (auto & info : registers)
        if (info.name == name)
            return info.id;

    StringSet names;
    for (auto & info : registers)
        names.insert(std::string(info.name));
    return OrSuggestions<RegisterId>::failed(Suggestions::bestMatches(names, name));
}

const RegisterInfo & registerInfoByName(std::string_view name)
{
    auto id = lookupRegister(name);
    if (!id)
        throw UsageError(id.getSuggestions(), "unknown register '%s'", name);
    return registerInfo(*id);
}

const RegisterInfo * registerInfoByDwarf(unsigned int dwarfId)
{
    for (auto & info : registers)
        if (info.dwarfId == dwarfId)
            return &info;
    return nullptr;
}

std::string_view showRegisterKind(RegisterKind kind)
{
    switch (kind) {
    case RegisterKind::GeneralPurpose:
        return "general purpose";
    case RegisterKind::SubGeneralPurpose:
        return "sub general purpose";
    case RegisterKind::FloatingPoint:
        return "floating point";
    case RegisterKind::Debug:
        return "debug";
    }
    unreachable();
}

} // namespace sdbg

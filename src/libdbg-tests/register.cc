#include "sdbg/dbg/register.hh"
#include "sdbg/util/error.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstddef>
#include <set>

#include <sys/user.h>

namespace sdbg {

using ::testing::HasSubstr;

TEST(allRegisters, orderedById)
{
    auto regs = allRegisters();
    for (size_t i = 0; i < regs.size(); ++i)
        ASSERT_EQ((size_t) regs[i].id, i);
}

TEST(allRegisters, namesAreUnique)
{
    std::set<std::string_view> names;
    for (auto & info : allRegisters())
        ASSERT_TRUE(names.insert(info.name).second) << info.name;
}

TEST(allRegisters, fitInsideUser)
{
    for (auto & info : allRegisters())
        ASSERT_LE(info.offset + info.byteWidth, sizeof(struct user)) << info.name;
}

TEST(registerInfo, generalPurpose)
{
    auto & rip = registerInfo(RegisterId::Rip);

    ASSERT_EQ(rip.name, "rip");
    ASSERT_EQ(rip.dwarfId, 16u);
    ASSERT_EQ(rip.kind, RegisterKind::GeneralPurpose);
    ASSERT_EQ(rip.repr, RegisterRepr::UInt);
    ASSERT_EQ(rip.byteWidth, 8u);
    ASSERT_EQ(rip.offset, offsetof(struct user, regs) + offsetof(struct user_regs_struct, rip));
}

TEST(registerInfo, subRegistersShareTheirBase)
{
    auto raxOffset = registerInfo(RegisterId::Rax).offset;

    ASSERT_EQ(registerInfo(RegisterId::Eax).offset, raxOffset);
    ASSERT_EQ(registerInfo(RegisterId::Eax).byteWidth, 4u);
    ASSERT_EQ(registerInfo(RegisterId::Ax).offset, raxOffset);
    ASSERT_EQ(registerInfo(RegisterId::Ax).byteWidth, 2u);
    ASSERT_EQ(registerInfo(RegisterId::Al).offset, raxOffset);
    ASSERT_EQ(registerInfo(RegisterId::Ah).offset, raxOffset + 1);
    ASSERT_EQ(registerInfo(RegisterId::Ah).byteWidth, 1u);
    ASSERT_EQ(registerInfo(RegisterId::Ah).kind, RegisterKind::SubGeneralPurpose);
    ASSERT_EQ(registerInfo(RegisterId::Ah).dwarfId, std::nullopt);
}

TEST(registerInfo, mmxAliasesX87Stack)
{
    auto & st3 = registerInfo(RegisterId::St3);
    auto & mm3 = registerInfo(RegisterId::Mm3);

    ASSERT_EQ(st3.offset, mm3.offset);
    ASSERT_EQ(st3.repr, RegisterRepr::LongDouble);
    ASSERT_EQ(st3.byteWidth, 16u);
    ASSERT_EQ(mm3.repr, RegisterRepr::Vector);
    ASSERT_EQ(mm3.byteWidth, 8u);
}

TEST(registerInfo, debugRegisters)
{
    auto & dr7 = registerInfo(RegisterId::Dr7);

    ASSERT_EQ(dr7.kind, RegisterKind::Debug);
    ASSERT_EQ(dr7.offset, offsetof(struct user, u_debugreg) + 7 * 8);
}

TEST(registerInfoByName, known)
{
    ASSERT_EQ(registerInfoByName("xmm15").id, RegisterId::Xmm15);
    ASSERT_EQ(registerInfoByName("fs_base").id, RegisterId::FsBase);
    ASSERT_EQ(registerInfoByName("r8b").id, RegisterId::R8b);
}

TEST(registerInfoByName, unknownHasSuggestions)
{
    try {
        registerInfoByName("rxa");
        FAIL() << "expected a UsageError";
    } catch (UsageError & e) {
        /* "ax" and "rax" are both two edits away. */
        auto suggestions = e.info().suggestions.trim();
        ASSERT_THAT(suggestions.to_string(), HasSubstr("rax"));
        ASSERT_THAT(suggestions.to_string(), HasSubstr("ax"));
    }
}

TEST(lookupRegister, unknown)
{
    ASSERT_FALSE(lookupRegister("xmm16"));
    ASSERT_TRUE(lookupRegister("xmm1"));
}

TEST(registerInfoByDwarf, mapping)
{
    ASSERT_EQ(registerInfoByDwarf(0)->id, RegisterId::Rax);
    ASSERT_EQ(registerInfoByDwarf(7)->id, RegisterId::Rsp);
    ASSERT_EQ(registerInfoByDwarf(17)->id, RegisterId::Xmm0);
    ASSERT_EQ(registerInfoByDwarf(33)->id, RegisterId::St0);
    ASSERT_EQ(registerInfoByDwarf(41)->id, RegisterId::Mm0);
    ASSERT_EQ(registerInfoByDwarf(49)->id, RegisterId::Eflags);
    ASSERT_EQ(registerInfoByDwarf(64)->id, RegisterId::Mxcsr);
    ASSERT_EQ(registerInfoByDwarf(1000), nullptr);
}

TEST(showRegisterKind, names)
{
    ASSERT_EQ(showRegisterKind(RegisterKind::GeneralPurpose), "general purpose");
    ASSERT_EQ(showRegisterKind(RegisterKind::Debug), "debug");
}

} // namespace sdbg

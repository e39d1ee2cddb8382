#include "sdbg/dbg/register-value.hh"
#include "sdbg/util/error.hh"

#include <gtest/gtest.h>

#include <cstring>

namespace sdbg {

class RegisterValueTest : public ::testing::Test
{
protected:
    struct user user;

    void SetUp() override
    {
        std::memset(&user, 0, sizeof(user));
    }

    RegisterValue read(RegisterId id)
    {
        return readFromUser(registerInfo(id), user);
    }

    void write(RegisterId id, const RegisterValue & value)
    {
        writeToUser(registerInfo(id), user, value);
    }

    void writeAny(RegisterId id, const RegisterValue & value)
    {
        writeAnyToUser(registerInfo(id), user, value);
    }
};

TEST_F(RegisterValueTest, zeroedUserReadsZero)
{
    ASSERT_EQ(read(RegisterId::Rax), RegisterValue{uint64_t(0)});
    ASSERT_EQ(read(RegisterId::R15d), RegisterValue{uint32_t(0)});
    ASSERT_EQ(read(RegisterId::Xmm0), RegisterValue{Byte128{}});
    ASSERT_EQ(read(RegisterId::Mm0), RegisterValue{Byte64{}});
    ASSERT_EQ(read(RegisterId::St0), RegisterValue{(long double) 0});
}

TEST_F(RegisterValueTest, writeThenRead)
{
    write(RegisterId::Rax, uint64_t(1));
    ASSERT_EQ(read(RegisterId::Rax), RegisterValue{uint64_t(1)});

    write(RegisterId::R15d, uint32_t(2));
    ASSERT_EQ(read(RegisterId::R15d), RegisterValue{uint32_t(2)});

    Byte128 bytes;
    bytes.fill(42);
    write(RegisterId::Xmm0, bytes);
    ASSERT_EQ(read(RegisterId::Xmm0), RegisterValue{bytes});

    write(RegisterId::St1, (long double) 1.5);
    ASSERT_EQ(read(RegisterId::St1), RegisterValue{(long double) 1.5});
}

TEST_F(RegisterValueTest, writeRequiresExactWidth)
{
    ASSERT_THROW(write(RegisterId::Rax, uint32_t(1)), Error);
    ASSERT_THROW(write(RegisterId::Al, uint16_t(1)), Error);
}

TEST_F(RegisterValueTest, subRegistersViewTheirBase)
{
    write(RegisterId::Rax, uint64_t(0x1122334455667788));

    ASSERT_EQ(read(RegisterId::Eax), RegisterValue{uint32_t(0x55667788)});
    ASSERT_EQ(read(RegisterId::Ax), RegisterValue{uint16_t(0x7788)});
    ASSERT_EQ(read(RegisterId::Al), RegisterValue{uint8_t(0x88)});
    ASSERT_EQ(read(RegisterId::Ah), RegisterValue{uint8_t(0x77)});

    write(RegisterId::Ah, uint8_t(0xff));
    ASSERT_EQ(read(RegisterId::Rax), RegisterValue{uint64_t(0x112233445566ff88)});
}

TEST_F(RegisterValueTest, writeAnyZeroExtends)
{
    writeAny(RegisterId::R15d, uint8_t(69));
    ASSERT_EQ(read(RegisterId::R15d), RegisterValue{uint32_t(69)});

    writeAny(RegisterId::R15d, uint16_t(69));
    ASSERT_EQ(read(RegisterId::R15d), RegisterValue{uint32_t(69)});

    writeAny(RegisterId::R15d, uint32_t(69));
    ASSERT_EQ(read(RegisterId::R15d), RegisterValue{uint32_t(69)});
}

TEST_F(RegisterValueTest, writeAnySignExtends)
{
    writeAny(RegisterId::Rbx, int8_t(-1));
    ASSERT_EQ(read(RegisterId::Rbx), RegisterValue{uint64_t(0xffffffffffffffff)});

    writeAny(RegisterId::Ecx, int16_t(-2));
    ASSERT_EQ(read(RegisterId::Ecx), RegisterValue{uint32_t(0xfffffffe)});
}

TEST_F(RegisterValueTest, writeAnyConvertsToLongDouble)
{
    writeAny(RegisterId::St0, 2.5);
    ASSERT_EQ(read(RegisterId::St0), RegisterValue{(long double) 2.5});

    writeAny(RegisterId::St0, 0.25f);
    ASSERT_EQ(read(RegisterId::St0), RegisterValue{(long double) 0.25});
}

TEST_F(RegisterValueTest, writeAnyStoresFloatBitsInVectors)
{
    writeAny(RegisterId::Xmm1, 1.0f);

    Byte128 expected{};
    float f = 1.0f;
    std::memcpy(expected.data(), &f, sizeof(f));
    ASSERT_EQ(read(RegisterId::Xmm1), RegisterValue{expected});
}

TEST_F(RegisterValueTest, writeAnyRejectsWiderValues)
{
    ASSERT_THROW(writeAny(RegisterId::Eax, uint64_t(1)), Error);
    ASSERT_THROW(writeAny(RegisterId::Mm0, Byte128{}), Error);
}

TEST(formatRegisterValue, formats)
{
    ASSERT_EQ(formatRegisterValue(uint8_t(0x0a)), "0x0a");
    ASSERT_EQ(formatRegisterValue(uint32_t(0xbeef)), "0x0000beef");
    ASSERT_EQ(formatRegisterValue(uint64_t(1)), "0x0000000000000001");
    ASSERT_EQ(formatRegisterValue(int32_t(-5)), "-5");
    ASSERT_EQ(formatRegisterValue((long double) 1.5), "1.5");
    ASSERT_EQ(formatRegisterValue(Byte64{1, 2, 3, 4, 5, 6, 7, 255}), "[0x01,0x02,0x03,0x04,0x05,0x06,0x07,0xff]");
}

TEST(parseRegisterValue, integers)
{
    ASSERT_EQ(parseRegisterValue(registerInfo(RegisterId::Rax), "42"), RegisterValue{uint64_t(42)});
    ASSERT_EQ(parseRegisterValue(registerInfo(RegisterId::Rax), "0x2a"), RegisterValue{uint64_t(42)});
    ASSERT_EQ(parseRegisterValue(registerInfo(RegisterId::Al), "0xff"), RegisterValue{uint8_t(0xff)});
    ASSERT_EQ(parseRegisterValue(registerInfo(RegisterId::Eax), "4294967295"), RegisterValue{uint32_t(0xffffffff)});
}

TEST(parseRegisterValue, integerOutOfRange)
{
    ASSERT_THROW(parseRegisterValue(registerInfo(RegisterId::Al), "256"), UsageError);
    ASSERT_THROW(parseRegisterValue(registerInfo(RegisterId::Ax), "0x10000"), UsageError);
}

TEST(parseRegisterValue, invalidInteger)
{
    ASSERT_THROW(parseRegisterValue(registerInfo(RegisterId::Rax), "forty-two"), UsageError);
    ASSERT_THROW(parseRegisterValue(registerInfo(RegisterId::Rax), "0x"), UsageError);
    ASSERT_THROW(parseRegisterValue(registerInfo(RegisterId::Rax), ""), UsageError);
}

TEST(parseRegisterValue, longDouble)
{
    ASSERT_EQ(parseRegisterValue(registerInfo(RegisterId::St0), "-1.25"), RegisterValue{(long double) -1.25});
    ASSERT_THROW(parseRegisterValue(registerInfo(RegisterId::St0), "one"), UsageError);
}

TEST(parseRegisterValue, vector)
{
    ASSERT_EQ(
        parseRegisterValue(registerInfo(RegisterId::Mm2), "[0x01, 2,0x03,4,5,6,7,0xff]"),
        (RegisterValue{Byte64{1, 2, 3, 4, 5, 6, 7, 255}}));
}

TEST(parseRegisterValue, vectorWrongLength)
{
    ASSERT_THROW(parseRegisterValue(registerInfo(RegisterId::Xmm0), "[1,2,3]"), UsageError);
    ASSERT_THROW(parseRegisterValue(registerInfo(RegisterId::Xmm0), "1,2,3"), UsageError);
    ASSERT_THROW(parseRegisterValue(registerInfo(RegisterId::Mm0), "[1,2,3,4,5,6,7,256]"), UsageError);
}

} // namespace sdbg

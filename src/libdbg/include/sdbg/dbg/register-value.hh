#pragma once
///@file

#include "sdbg/dbg/register.hh"

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include <sys/user.h>

namespace sdbg {

using Byte64 = std::array<uint8_t, 8>;
using Byte128 = std::array<uint8_t, 16>;

/**
 * The contents of a register, or a value to be written into one.
 */
using RegisterValue = std::variant<
    uint8_t,
    uint16_t,
    uint32_t,
    uint64_t,
    int8_t,
    int16_t,
    int32_t,
    int64_t,
    float,
    double,
    long double,
    Byte64,
    Byte128>;

/**
 * The number of bytes `value` occupies in a register.
 */
size_t registerValueSize(const RegisterValue & value);

/**
 * Read register `info` from `user`, as the type implied by its
 * representation and width.
 */
RegisterValue readFromUser(const RegisterInfo & info, const struct user & user);

/**
 * Store `value` into register `info` of `user`. The value must be
 * exactly as wide as the register.
 */
void writeToUser(const RegisterInfo & info, struct user & user, const RegisterValue & value);

/**
 * Store `value` into register `info` of `user`, widening it if it is
 * narrower than the register. Integers are zero- or sign-extended;
 * floating point values become `long double` in x87 stack registers
 * and are stored as their bit pattern elsewhere.
 */
void writeAnyToUser(const RegisterInfo & info, struct user & user, const RegisterValue & value);

std::string formatRegisterValue(const RegisterValue & value);

/**
 * Parse user input for register `info`: an integer (decimal or `0x`
 * hex) for integer registers, a floating point literal for x87 stack
 * registers, and `[b0,b1,...]` with one hex byte per register byte
 * for vector registers.
 *
 * @throws UsageError if `s` is not a valid value for the register.
 */
RegisterValue parseRegisterValue(const RegisterInfo & info, std::string_view s);

} // namespace sdbg

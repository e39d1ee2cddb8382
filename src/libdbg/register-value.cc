#include "sdbg/dbg/register-value.hh"
#include "sdbg/util/error.hh"
#include "sdbg/util/strings.hh"

#include <algorithm>
#include <charconv>
#include <concepts>
#include <cstring>

namespace sdbg {

template<typename T>
static T fromBytes(const uint8_t * bytes)
{
    T value;
    std::memcpy(&value, bytes, sizeof(T));
    return value;
}

static const uint8_t * registerBytes(const RegisterInfo & info, const struct user & user)
{
    return reinterpret_cast<const uint8_t *>(&user) + info.offset;
}

static uint8_t * registerBytes(const RegisterInfo & info, struct user & user)
{
    return reinterpret_cast<uint8_t *>(&user) + info.offset;
}

size_t registerValueSize(const RegisterValue & value)
{
    return std::visit([](const auto & v) { return sizeof(v); }, value);
}

RegisterValue readFromUser(const RegisterInfo & info, const struct user & user)
{
    auto bytes = registerBytes(info, user);

    switch (info.repr) {
    case RegisterRepr::UInt:
        switch (info.byteWidth) {
        case 1:
            return fromBytes<uint8_t>(bytes);
        case 2:
            return fromBytes<uint16_t>(bytes);
        case 4:
            return fromBytes<uint32_t>(bytes);
        case 8:
            return fromBytes<uint64_t>(bytes);
        }
        break;
    case RegisterRepr::LongDouble:
        return fromBytes<long double>(bytes);
    case RegisterRepr::Vector:
        switch (info.byteWidth) {
        case 8:
            return fromBytes<Byte64>(bytes);
        case 16:
            return fromBytes<Byte128>(bytes);
        }
        break;
    }

    throw Error("register '%s' has unsupported width %d", info.name, info.byteWidth);
}

void writeToUser(const RegisterInfo & info, struct user & user, const RegisterValue & value)
{
    auto size = registerValueSize(value);
    if (size != info.byteWidth)
        throw Error("cannot write a %d-byte value into the %d-byte register '%s'", size, info.byteWidth, info.name);

    auto bytes = registerBytes(info, user);
    std::visit([&](const auto & v) { std::memcpy(bytes, &v, sizeof(v)); }, value);
}

void writeAnyToUser(const RegisterInfo & info, struct user & user, const RegisterValue & value)
{
    auto size = registerValueSize(value);
    if (size > info.byteWidth)
        throw Error("a %d-byte value does not fit into the %d-byte register '%s'", size, info.byteWidth, info.name);

    Byte128 buf{};

    std::visit(
        overloaded{
            [&](const std::floating_point auto & v) {
                if (info.repr == RegisterRepr::LongDouble) {
                    long double ld = v;
                    std::memcpy(buf.data(), &ld, sizeof(ld));
                } else
                    std::memcpy(buf.data(), &v, sizeof(v));
            },
            [&](const std::signed_integral auto & v) {
                if (v < 0)
                    buf.fill(0xff);
                std::memcpy(buf.data(), &v, sizeof(v));
            },
            [&](const auto & v) { std::memcpy(buf.data(), &v, sizeof(v)); },
        },
        value);

    std::memcpy(registerBytes(info, user), buf.data(), info.byteWidth);
}

template<size_t N>
static std::string formatBytes(const std::array<uint8_t, N> & bytes)
{
    Strings parts;
    for (auto b : bytes)
        parts.push_back(fmt("0x%02x", (unsigned int) b));
    return "[" + concatStringsSep(",", parts) + "]";
}

std::string formatRegisterValue(const RegisterValue & value)
{
    return std::visit(
        overloaded{
            [](const std::unsigned_integral auto & v) -> std::string {
                return fmt("0x%0" + std::to_string(sizeof(v) * 2) + "x", (uint64_t) v);
            },
            [](const std::signed_integral auto & v) -> std::string { return fmt("%d", (int64_t) v); },
            [](const std::floating_point auto & v) -> std::string { return fmt("%g", v); },
            [](const Byte64 & v) -> std::string { return formatBytes(v); },
            [](const Byte128 & v) -> std::string { return formatBytes(v); },
        },
        value);
}

static std::optional<uint64_t> parseHex(std::string_view s)
{
    if (s.empty())
        return std::nullopt;
    uint64_t n;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), n, 16);
    if (ec != std::errc() || ptr != s.data() + s.size())
        return std::nullopt;
    return n;
}

static std::optional<uint64_t> parseUInt(std::string_view s)
{
    if (hasPrefix(s, "0x") || hasPrefix(s, "0X"))
        return parseHex(s.substr(2));
    return string2Int<uint64_t>(s);
}

RegisterValue parseRegisterValue(const RegisterInfo & info, std::string_view s)
{
    switch (info.repr) {
    case RegisterRepr::UInt: {
        auto n = parseUInt(s);
        if (!n)
            throw UsageError("'%s' is not a valid value for register '%s'", s, info.name);
        if (info.byteWidth < 8 && (*n >> (info.byteWidth * 8)) != 0)
            throw UsageError("value '%s' does not fit into the %d-byte register '%s'", s, info.byteWidth, info.name);
        switch (info.byteWidth) {
        case 1:
            return (uint8_t) *n;
        case 2:
            return (uint16_t) *n;
        case 4:
            return (uint32_t) *n;
        default:
            return *n;
        }
    }

    case RegisterRepr::LongDouble: {
        auto f = string2Float<long double>(s);
        if (!f)
            throw UsageError("'%s' is not a valid floating point value for register '%s'", s, info.name);
        return *f;
    }

    case RegisterRepr::Vector: {
        auto inner = trim(s);
        if (!hasPrefix(inner, "[") || !hasSuffix(inner, "]"))
            throw UsageError("value for vector register '%s' must be of the form '[b0,b1,...]'", info.name);
        inner = inner.substr(1, inner.size() - 2);

        Byte128 bytes{};
        size_t count = 0;
        for (auto & token : tokenizeString<Strings>(inner, ",")) {
            auto byte = parseUInt(trim(token));
            if (!byte || *byte > 0xff)
                throw UsageError("'%s' is not a valid byte for register '%s'", trim(token), info.name);
            if (count < bytes.size())
                bytes[count] = *byte;
            count++;
        }
        if (count != info.byteWidth)
            throw UsageError("register '%s' takes %d bytes, but %d were given", info.name, info.byteWidth, count);

        if (info.byteWidth == 8) {
            Byte64 res;
            std::copy_n(bytes.begin(), res.size(), res.begin());
            return res;
        }
        return bytes;
    }
    }

    unreachable();
}

} // namespace sdbg

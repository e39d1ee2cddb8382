#include "sdbg/util/environment-variables.hh"

#include <cstdlib>

namespace sdbg {

std::optional<std::string> getEnv(const std::string & key)
{
    if (auto value = std::getenv(key.c_str()))
        return value;
    return std::nullopt;
}

std::optional<std::string> getEnvNonEmpty(const std::string & key)
{
    auto value = getEnv(key);
    return value && !value->empty() ? value : std::nullopt;
}

} // namespace sdbg

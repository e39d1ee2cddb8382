#pragma once
///@file

#include <optional>
#include <string>

namespace sdbg {

std::optional<std::string> getEnv(const std::string & key);

/**
 * Like `getEnv()`, but an empty variable counts as unset.
 */
std::optional<std::string> getEnvNonEmpty(const std::string & key);

} // namespace sdbg

#pragma once
///@file

#include <string>

namespace sdbg {

enum class LogFormat {
    raw,
    internalJSON,
};

/**
 * @throws UsageError for anything but `raw` and `internal-json`.
 */
LogFormat parseLogFormat(const std::string & s);

/**
 * Replace `logger` with one writing `format` to stderr.
 */
void setLogFormat(const std::string & s);
void setLogFormat(const LogFormat & format);

} // namespace sdbg

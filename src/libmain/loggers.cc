#include "sdbg/main/loggers.hh"
#include "sdbg/util/error.hh"
#include "sdbg/util/file-descriptor.hh"
#include "sdbg/util/logging.hh"

namespace sdbg {

LogFormat parseLogFormat(const std::string & s)
{
    if (s == "raw")
        return LogFormat::raw;
    if (s == "internal-json")
        return LogFormat::internalJSON;
    throw UsageError("unknown log format '%s'; expected 'raw' or 'internal-json'", s);
}

void setLogFormat(const std::string & s)
{
    setLogFormat(parseLogFormat(s));
}

void setLogFormat(const LogFormat & format)
{
    switch (format) {
    case LogFormat::raw:
        logger = makeSimpleLogger();
        return;
    case LogFormat::internalJSON:
        logger = makeJSONLogger(getStandardError());
        return;
    }
    unreachable();
}

} // namespace sdbg

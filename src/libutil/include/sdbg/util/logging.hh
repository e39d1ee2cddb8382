#pragma once
///@file

#include "sdbg/util/configuration.hh"
#include "sdbg/util/error.hh"
#include "sdbg/util/file-descriptor.hh"
#include "sdbg/util/finally.hh"

#include <cstdint>
#include <functional>
#include <memory>
#include <variant>
#include <vector>

namespace sdbg {

typedef enum {
    actUnknown = 0,
    actAttach = 100,
    actLaunch = 101,
    actWait = 102,
    actResume = 103,
    actDetach = 104,
    actReadRegisters = 105,
    actWriteRegisters = 106,
    actRepl = 107,
} ActivityType;

typedef enum {
    resProcessState = 100,
    resRegisterValue = 101,
} ResultType;

typedef uint64_t ActivityId;

struct LoggerSettings : Config
{
    OptionalPathSetting jsonLogPath{
        this,
        {},
        "json-log-path",
        R"(
          A file to which JSON records of the log output are appended,
          in the format of `--log-format internal-json` but without the
          `@sdbg ` prefix on each line.
        )"};
};

extern LoggerSettings loggerSettings;

/**
 * Where diagnostics (messages, errors, activities) and program output
 * go. `logger` is the current one.
 */
class Logger
{
public:

    using Field = std::variant<uint64_t, std::string>;

    typedef std::vector<Field> Fields;

    virtual ~Logger() {}

    virtual void log(Verbosity lvl, std::string_view s) = 0;

    virtual void logEI(const ErrorInfo & ei) = 0;

    void logEI(Verbosity lvl, ErrorInfo ei)
    {
        ei.level = lvl;
        logEI(ei);
    }

    virtual void warn(const std::string & msg);

    virtual void startActivity(
        ActivityId act, Verbosity lvl, ActivityType type, const std::string & s, const Fields & fields, ActivityId parent)
    {
    }

    virtual void stopActivity(ActivityId act) {}

    virtual void result(ActivityId act, ResultType type, const Fields & fields) {}

    /**
     * Output of the program itself, e.g. register dumps. Always goes
     * to stdout, followed by a newline.
     */
    virtual void writeToStdout(std::string_view s);

    template<typename... Args>
    void cout(const std::string & fs, const Args &... args)
    {
        writeToStdout(fmt(fs, args...));
    }

    /**
     * Stop drawing on the terminal while someone else owns it, e.g.
     * while the REPL reads a line.
     */
    virtual void pause() {}

    virtual void resume() {}

    using Suspension = Finally<std::function<void()>>;

    /**
     * `pause()` now and `resume()` when the result is destroyed.
     */
    Suspension suspend();
};

ActivityId getCurActivity();

/**
 * A step of work that is reported when it starts and when it ends
 * (i.e. when the `Activity` is destroyed), and may report results in
 * between.
 */
struct Activity
{
    Logger & logger;

    const ActivityId id;

    /**
     * Restored as the current activity on destruction.
     */
    const ActivityId enclosing;

    Activity(
        Logger & logger,
        Verbosity lvl,
        ActivityType type,
        const std::string & s = "",
        const Logger::Fields & fields = {},
        ActivityId parent = getCurActivity());

    Activity(const Activity &) = delete;

    ~Activity();

    template<typename... Args>
    void result(ResultType type, const Args &... args) const
    {
        logger.result(id, type, Logger::Fields{Logger::Field(args)...});
    }
};

extern std::unique_ptr<Logger> logger;

/**
 * Human-readable messages on stderr, coloured if stderr is a terminal.
 */
std::unique_ptr<Logger> makeSimpleLogger();

/**
 * One JSON object per line on `fd`, each prefixed by `@sdbg ` if
 * `includeSdbgPrefix`. Write errors disable the logger.
 */
std::unique_ptr<Logger> makeJSONLogger(Descriptor fd, bool includeSdbgPrefix = true);

/**
 * Like the above, appending to the file at `path`.
 */
std::unique_ptr<Logger> makeJSONLogger(const Path & path, bool includeSdbgPrefix = true);

/**
 * Send everything to `main` and `extra`, but only `main` writes to
 * stdout.
 */
std::unique_ptr<Logger> makeTeeLogger(std::unique_ptr<Logger> main, std::unique_ptr<Logger> extra);

/**
 * If `json-log-path` is set, also send all log records to that file.
 */
void applyJSONLogger();

/**
 * Messages above this level are dropped.
 */
extern Verbosity verbosity;

/**
 * Report an `ErrorInfo` at `level`. A macro so that the arguments are
 * only evaluated if the message is shown.
 */
#define logErrorInfo(level, errorInfo...)      \
    do {                                       \
        if ((level) <= sdbg::verbosity) {      \
            logger->logEI((level), errorInfo); \
        }                                      \
    } while (0)

#define logError(errorInfo...) logErrorInfo(lvlError, errorInfo)
#define logWarning(errorInfo...) logErrorInfo(lvlWarn, errorInfo)

#define printMsg(level, args...)                \
    do {                                        \
        auto __lvl = level;                     \
        if (__lvl <= sdbg::verbosity) {         \
            logger->log(__lvl, fmt(args));      \
        }                                       \
    } while (0)

#define printError(args...) printMsg(lvlError, args)
#define printInfo(args...) printMsg(lvlInfo, args)
#define debug(args...) printMsg(lvlDebug, args)
#define vomit(args...) printMsg(lvlVomit, args)

/**
 * Log `fs` with a `warning:` prefix.
 */
template<typename... Args>
inline void warn(const std::string & fs, const Args &... args)
{
    logger->warn(fmt(fs, args...));
}

/**
 * Write to stderr, ignoring errors so that reporting a problem can
 * not cause another.
 */
void writeToStderr(std::string_view s);

} // namespace sdbg

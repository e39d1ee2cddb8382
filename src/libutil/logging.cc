#include "sdbg/util/logging.hh"
#include "sdbg/util/config-global.hh"
#include "sdbg/util/terminal.hh"

#include <atomic>
#include <mutex>
#include <sstream>

#include <fcntl.h>

#include <nlohmann/json.hpp>

namespace sdbg {

LoggerSettings loggerSettings;

static GlobalConfig::Register rLoggerSettings(&loggerSettings);

Verbosity verbosity = lvlInfo;

static thread_local ActivityId curActivity = 0;

ActivityId getCurActivity()
{
    return curActivity;
}

Logger::Suspension Logger::suspend()
{
    pause();
    return Suspension(std::function<void()>([this]() { resume(); }));
}

void Logger::warn(const std::string & msg)
{
    log(lvlWarn, ANSI_WARNING "warning:" ANSI_NORMAL " " + msg);
}

void Logger::writeToStdout(std::string_view s)
{
    writeLine(getStandardOutput(), std::string(s));
}

void writeToStderr(std::string_view s)
{
    try {
        writeFull(getStandardError(), s, false);
    } catch (SystemError &) {
        /* stderr may be gone, e.g. when the terminal was closed. */
    }
}

namespace {

class SimpleLogger : public Logger
{
    const bool colour = isTTY();

public:

    void log(Verbosity lvl, std::string_view s) override
    {
        if (lvl <= verbosity)
            writeToStderr(filterANSIEscapes(s, !colour) + "\n");
    }

    void logEI(const ErrorInfo & ei) override
    {
        std::ostringstream text;
        showErrorInfo(text, ei);
        log(ei.level, text.str());
    }

    void startActivity(
        ActivityId act, Verbosity lvl, ActivityType type, const std::string & s, const Fields & fields, ActivityId parent)
        override
    {
        if (!s.empty())
            log(lvl, s + "...");
    }
};

class JSONLogger : public Logger
{
    Descriptor fd;
    bool includeSdbgPrefix;

    std::mutex lock;
    bool enabled = true;

    static void addFields(nlohmann::json & record, const Fields & fields)
    {
        if (fields.empty())
            return;
        auto & out = record["fields"] = nlohmann::json::array();
        for (auto & field : fields)
            std::visit([&](const auto & v) { out.push_back(v); }, field);
    }

    void write(const nlohmann::json & record)
    {
        auto line = record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        if (includeSdbgPrefix)
            line = "@sdbg " + line;

        std::unique_lock<std::mutex> guard(lock);
        if (!enabled)
            return;
        try {
            writeLine(fd, std::move(line));
        } catch (SystemError & e) {
            enabled = false;
            guard.unlock();
            writeToStderr(fmt("warning: disabling the JSON logger after a write error: %s\n", e.message()));
        }
    }

public:

    JSONLogger(Descriptor fd, bool includeSdbgPrefix)
        : fd(fd)
        , includeSdbgPrefix(includeSdbgPrefix)
    {
    }

    void log(Verbosity lvl, std::string_view s) override
    {
        write({{"action", "msg"}, {"level", lvl}, {"msg", std::string(s)}});
    }

    void logEI(const ErrorInfo & ei) override
    {
        std::ostringstream text;
        showErrorInfo(text, ei);
        write({{"action", "msg"}, {"level", ei.level}, {"msg", text.str()}, {"raw_msg", ei.msg.str()}});
    }

    void startActivity(
        ActivityId act, Verbosity lvl, ActivityType type, const std::string & s, const Fields & fields, ActivityId parent)
        override
    {
        nlohmann::json record{
            {"action", "start"}, {"id", act}, {"level", lvl}, {"type", type}, {"text", s}, {"parent", parent}};
        addFields(record, fields);
        write(record);
    }

    void stopActivity(ActivityId act) override
    {
        write({{"action", "stop"}, {"id", act}});
    }

    void result(ActivityId act, ResultType type, const Fields & fields) override
    {
        nlohmann::json record{{"action", "result"}, {"id", act}, {"type", type}};
        addFields(record, fields);
        write(record);
    }
};

class JSONFileLogger : public JSONLogger
{
    AutoCloseFD file;

public:

    JSONFileLogger(AutoCloseFD && file, bool includeSdbgPrefix)
        : JSONLogger(file.get(), includeSdbgPrefix)
        , file(std::move(file))
    {
    }
};

class TeeLogger : public Logger
{
    std::unique_ptr<Logger> main, extra;

public:

    TeeLogger(std::unique_ptr<Logger> main, std::unique_ptr<Logger> extra)
        : main(std::move(main))
        , extra(std::move(extra))
    {
    }

    void log(Verbosity lvl, std::string_view s) override
    {
        main->log(lvl, s);
        extra->log(lvl, s);
    }

    void logEI(const ErrorInfo & ei) override
    {
        main->logEI(ei);
        extra->logEI(ei);
    }

    void warn(const std::string & msg) override
    {
        main->warn(msg);
        extra->warn(msg);
    }

    void startActivity(
        ActivityId act, Verbosity lvl, ActivityType type, const std::string & s, const Fields & fields, ActivityId parent)
        override
    {
        main->startActivity(act, lvl, type, s, fields, parent);
        extra->startActivity(act, lvl, type, s, fields, parent);
    }

    void stopActivity(ActivityId act) override
    {
        main->stopActivity(act);
        extra->stopActivity(act);
    }

    void result(ActivityId act, ResultType type, const Fields & fields) override
    {
        main->result(act, type, fields);
        extra->result(act, type, fields);
    }

    void writeToStdout(std::string_view s) override
    {
        main->writeToStdout(s);
    }

    void pause() override
    {
        main->pause();
    }

    void resume() override
    {
        main->resume();
    }
};

} // namespace

std::unique_ptr<Logger> makeSimpleLogger()
{
    return std::make_unique<SimpleLogger>();
}

std::unique_ptr<Logger> makeJSONLogger(Descriptor fd, bool includeSdbgPrefix)
{
    return std::make_unique<JSONLogger>(fd, includeSdbgPrefix);
}

std::unique_ptr<Logger> makeJSONLogger(const Path & path, bool includeSdbgPrefix)
{
    AutoCloseFD file = open(path.c_str(), O_CREAT | O_APPEND | O_WRONLY | O_CLOEXEC, 0644);
    if (!file)
        throw SysError("opening log file '%s'", path);
    return std::make_unique<JSONFileLogger>(std::move(file), includeSdbgPrefix);
}

std::unique_ptr<Logger> makeTeeLogger(std::unique_ptr<Logger> main, std::unique_ptr<Logger> extra)
{
    return std::make_unique<TeeLogger>(std::move(main), std::move(extra));
}

void applyJSONLogger()
{
    auto & path = loggerSettings.jsonLogPath.get();
    if (!path)
        return;
    try {
        auto file = makeJSONLogger(*path, false);
        logger = makeTeeLogger(std::move(logger), std::move(file));
    } catch (Error & e) {
        logWarning(e.info());
    }
}

std::unique_ptr<Logger> logger = makeSimpleLogger();

/* The top 32 bits keep ids from different debugger processes apart in
   a shared `json-log-path`. */
static std::atomic<uint64_t> nextId{0};

Activity::Activity(
    Logger & logger,
    Verbosity lvl,
    ActivityType type,
    const std::string & s,
    const Logger::Fields & fields,
    ActivityId parent)
    : logger(logger)
    , id(nextId++ + (((uint64_t) getpid()) << 32))
    , enclosing(curActivity)
{
    logger.startActivity(id, lvl, type, s, fields, parent);
    curActivity = id;
}

Activity::~Activity()
{
    curActivity = enclosing;
    try {
        logger.stopActivity(id);
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

} // namespace sdbg

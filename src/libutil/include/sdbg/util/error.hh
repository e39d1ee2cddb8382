#pragma once
/**
 * @file
 *
 * @brief Exceptions, and the reports the logger prints for them.
 *
 * Every exception thrown by stupid-dbg derives from `BaseError` and
 * carries an `ErrorInfo`. The text is only rendered (by
 * `showErrorInfo()`) when someone asks for it, usually the logger.
 */

#include "sdbg/util/fmt.hh"
#include "sdbg/util/suggestions.hh"

#include <cerrno>
#include <cstring>
#include <optional>
#include <source_location>

namespace sdbg {

/**
 * How chatty the logger is. A message is shown if its level is at
 * most the current `verbosity`.
 */
enum Verbosity : int {
    lvlError = 0,
    lvlWarn,
    lvlInfo,
    lvlTalkative,
    lvlDebug,
    lvlVomit,
};

struct ErrorInfo
{
    Verbosity level = lvlError;

    HintFmt msg;

    /**
     * Exit status of the program if the error ends it.
     */
    unsigned int status = 1;

    /**
     * Near misses for a name the user got wrong.
     */
    Suggestions suggestions;
};

/**
 * Write `info` with a coloured `error:`/`warning:`/... prefix, followed
 * by a "Did you mean" line if it has close suggestions.
 */
std::ostream & showErrorInfo(std::ostream & out, const ErrorInfo & info);

/**
 * Catch `Error` instead, unless `Interrupted` should be caught too.
 */
class BaseError : public std::exception
{
protected:
    mutable ErrorInfo err;

    mutable std::optional<std::string> what_;

    const std::string & calcWhat() const;

public:

    template<typename... Args>
    explicit BaseError(const std::string & fs, const Args &... args)
        : err{.msg = HintFmt(fs, args...)}
    {
    }

    template<typename... Args>
    BaseError(const Suggestions & suggestions, const std::string & fs, const Args &... args)
        : err{.msg = HintFmt(fs, args...), .suggestions = suggestions}
    {
    }

    BaseError(ErrorInfo && info)
        : err(std::move(info))
    {
    }

    /**
     * The bare message, without level prefix or suggestions.
     */
    std::string message() const
    {
        return err.msg.str();
    }

    const char * what() const noexcept override
    {
        return calcWhat().c_str();
    }

    /**
     * The message as `showErrorInfo()` renders it.
     */
    const std::string & msg() const
    {
        return calcWhat();
    }

    const ErrorInfo & info() const
    {
        return err;
    }

    /**
     * Prefix the message with what was being done, e.g. `failed to
     * execute command: <message>`.
     */
    template<typename... Args>
    void addContext(const std::string & fs, const Args &... args)
    {
        err.msg = HintFmt(HintFmt(fs, args...).str() + ": " + err.msg.str());
        what_.reset();
    }
};

#define MakeError(newClass, superClass) \
    class newClass : public superClass  \
    {                                   \
    public:                             \
        using superClass::superClass;   \
    }

MakeError(Error, BaseError);
MakeError(UsageError, Error);

/**
 * Catch this rather than `SysError`.
 */
MakeError(SystemError, Error);

/**
 * A failed system call. The message gets `strerror(errNo)` appended.
 */
class SysError : public SystemError
{
public:
    int errNo;

    template<typename... Args>
    SysError(int errNo, const Args &... args)
        : SystemError(ErrorInfo{.msg = HintFmt(HintFmt(args...).str() + ": " + strerror(errNo))})
        , errNo(errNo)
    {
    }

    /**
     * Uses the current `errno`, so nothing may touch it between the
     * failing call and this constructor.
     */
    template<typename... Args>
    SysError(const Args &... args)
        : SysError(errno, args...)
    {
    }
};

/**
 * Report the exception being handled at `lvl`. Only call this from a
 * `catch (...)` block in a destructor.
 */
void ignoreExceptionInDestructor(Verbosity lvl = lvlError);

/**
 * Report an internal error at `loc` and terminate.
 */
[[gnu::noinline, gnu::cold, noreturn]] void unreachable(std::source_location loc = std::source_location::current());

} // namespace sdbg

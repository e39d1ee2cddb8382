#pragma once
///@file

#include "sdbg/util/variant-wrapper.hh"

#include <iosfwd>
#include <optional>
#include <string>
#include <variant>

namespace sdbg {

/**
 * The run state of a traced process, as last observed by `waitpid()`.
 */
struct ProcessState
{
    struct Running
    {
        bool operator==(const Running &) const = default;
    };

    struct Stopped
    {
        std::optional<int> signal;

        bool operator==(const Stopped &) const = default;
    };

    struct Exited
    {
        /**
         * Unknown if the process was reaped by someone else.
         */
        std::optional<int> status;

        bool operator==(const Exited &) const = default;
    };

    struct Terminated
    {
        int signal;

        bool operator==(const Terminated &) const = default;
    };

    using Raw = std::variant<Running, Stopped, Exited, Terminated>;

    Raw raw;

    MAKE_WRAPPER_CONSTRUCTOR(ProcessState);

    bool operator==(const ProcessState &) const = default;

    /**
     * Whether the process still exists, i.e. is running or stopped.
     */
    bool isAlive() const;

    bool isStopped() const
    {
        return std::holds_alternative<Stopped>(raw);
    }

    std::string to_string() const;
};

std::ostream & operator<<(std::ostream & str, const ProcessState & state);

} // namespace sdbg

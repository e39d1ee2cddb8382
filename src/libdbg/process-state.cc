#include "sdbg/dbg/process-state.hh"
#include "sdbg/util/fmt.hh"
#include "sdbg/util/processes.hh"
#include "sdbg/util/types.hh"

#include <ostream>

namespace sdbg {

bool ProcessState::isAlive() const
{
    return std::holds_alternative<Running>(raw) || std::holds_alternative<Stopped>(raw);
}

std::string ProcessState::to_string() const
{
    return std::visit(
        overloaded{
            [](const Running &) -> std::string { return "running"; },
            [](const Stopped & s) -> std::string {
                return s.signal ? "stopped with signal: " + signalToString(*s.signal) : "stopped";
            },
            [](const Exited & e) -> std::string {
                return e.status ? fmt("exited with status code: %d", *e.status) : "exited";
            },
            [](const Terminated & t) -> std::string { return "terminated with signal: " + signalToString(t.signal); },
        },
        raw);
}

std::ostream & operator<<(std::ostream & str, const ProcessState & state)
{
    return str << state.to_string();
}

} // namespace sdbg

#pragma once
///@file

#include "sdbg/util/finally.hh"
#include "sdbg/util/types.hh"

#include <functional>
#include <optional>
#include <string>

namespace sdbg {

/**
 * Source of tab completions for the line being edited.
 */
struct ReplCompleter
{
    virtual ~ReplCompleter() = default;

    /**
     * @param line The input line up to the cursor.
     * @return Candidates for the word under the cursor.
     */
    virtual StringSet completeLine(const std::string & line) = 0;
};

enum class ReplInput {
    Line,
    EndOfFile,
    Interrupted,
};

/**
 * Reads the lines of an interactive session.
 */
class ReplInteracter
{
public:

    using Guard = Finally<std::function<void()>>;

    virtual ~ReplInteracter() = default;

    /**
     * Start a session completing with `completer`, which ends when the
     * result is destroyed.
     */
    virtual Guard init(ReplCompleter * completer) = 0;

    /**
     * Read one line into `input`. Ctrl-C abandons the line and yields
     * `ReplInput::Interrupted`.
     */
    virtual ReplInput getLine(std::string & input, const std::string & prompt) = 0;
};

/**
 * GNU readline, with history kept in `historyFile`.
 */
class ReadlineInteracter : public ReplInteracter
{
    std::optional<Path> historyFile;
    unsigned int historySize;

public:

    ReadlineInteracter(std::optional<Path> historyFile, unsigned int historySize)
        : historyFile(std::move(historyFile))
        , historySize(historySize)
    {
    }

    ~ReadlineInteracter() override;

    Guard init(ReplCompleter * completer) override;

    ReplInput getLine(std::string & input, const std::string & prompt) override;
};

} // namespace sdbg

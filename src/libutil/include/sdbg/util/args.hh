#pragma once
///@file

#include "sdbg/util/error.hh"
#include "sdbg/util/strings.hh"
#include "sdbg/util/types.hh"

#include <functional>
#include <iosfwd>
#include <limits>
#include <list>
#include <map>
#include <memory>
#include <optional>

namespace sdbg {

class MultiCommand;

/**
 * A command-line grammar: flags (`--name`, `-n`) that may appear
 * anywhere before `--`, and positional arguments that are matched in
 * order. Both hand the words they consume to a `Handler`.
 */
class Args
{
public:

    virtual ~Args() = default;

    /**
     * @throws UsageError if `cmdline` does not fit the flags and
     * arguments declared with `addFlag()` and `expectArgs()`.
     */
    void parseCmdline(const Strings & cmdline);

    /**
     * One line, shown in command listings.
     */
    virtual std::string description()
    {
        return "";
    }

    /**
     * Markdown shown at the end of the help page.
     */
    virtual std::string doc()
    {
        return "";
    }

    /**
     * Print a usage line, the description, the visible flags and the
     * documentation.
     */
    virtual void printHelp(const std::string & programName, std::ostream & out);

protected:

    /**
     * Arity of handlers that take all remaining words.
     */
    static constexpr size_t ArityAny = std::numeric_limits<size_t>::max();

    struct Handler
    {
        using Words = std::vector<std::string>;

        std::function<void(Words)> fun;
        size_t arity = 0;

        Handler() = default;

        Handler(std::function<void(Words)> && fun)
            : Handler(ArityAny, std::move(fun))
        {
        }

        Handler(std::function<void()> && f)
            : Handler(0, [f{std::move(f)}](Words) { f(); })
        {
        }

        Handler(std::function<void(std::string)> && f)
            : Handler(1, [f{std::move(f)}](Words ws) { f(std::move(ws[0])); })
        {
        }

        Handler(std::function<void(std::string, std::string)> && f)
            : Handler(2, [f{std::move(f)}](Words ws) { f(std::move(ws[0]), std::move(ws[1])); })
        {
        }

        Handler(std::vector<std::string> * dest)
            : Handler(ArityAny, [dest](Words ws) { *dest = std::move(ws); })
        {
        }

        Handler(std::string * dest)
            : Handler(1, [dest](Words ws) { *dest = std::move(ws[0]); })
        {
        }

        Handler(std::optional<std::string> * dest)
            : Handler(1, [dest](Words ws) { *dest = std::move(ws[0]); })
        {
        }

        /**
         * A flag that stores `val` in `*dest`.
         */
        template<class T>
        Handler(T * dest, const T & val)
            : Handler(0, [dest, val](Words) { *dest = val; })
        {
        }

        template<class I>
        Handler(I * dest)
            : Handler(1, [dest](Words ws) { *dest = parseInt<I>(ws[0]); })
        {
        }

        template<class I>
        Handler(std::optional<I> * dest)
            : Handler(1, [dest](Words ws) { *dest = parseInt<I>(ws[0]); })
        {
        }

    private:

        Handler(size_t arity, std::function<void(Words)> && fun)
            : fun(std::move(fun))
            , arity(arity)
        {
        }

        template<class I>
        static I parseInt(std::string_view s)
        {
            if (auto n = string2Int<I>(s))
                return *n;
            throw UsageError("'%s' is not an integer", s);
        }
    };

public:

    struct Flag
    {
        std::string longName;
        char shortName = 0;
        std::string description;
        std::string category;
        /**
         * Names of the flag's arguments, one per word it consumes.
         */
        Strings labels;
        Handler handler;
    };

    struct ExpectedArg
    {
        std::string label;
        bool optional = false;
        Handler handler;
    };

    void addFlag(Flag && flag);

    void expectArgs(ExpectedArg && arg)
    {
        expectedArgs.push_back(std::move(arg));
    }

    void expectArg(const std::string & label, std::string * dest, bool optional = false)
    {
        expectArgs({.label = label, .optional = optional, .handler = {dest}});
    }

    void expectArgs(const std::string & label, std::vector<std::string> * dest)
    {
        expectArgs({.label = label, .handler = {dest}});
    }

protected:

    std::map<std::string, std::shared_ptr<Flag>> longFlags;

    std::map<char, std::shared_ptr<Flag>> shortFlags;

    /**
     * Flags in these categories are accepted but left out of the help.
     */
    StringSet hiddenCategories;

    /**
     * Positional arguments still to be matched, in order. Matched ones
     * move to `processedArgs`, because their handlers may point into
     * them.
     */
    std::list<ExpectedArg> expectedArgs, processedArgs;

    /**
     * Run the flag at `pos` and advance `pos` past its arguments.
     *
     * @return false if there is no such flag.
     */
    virtual bool processFlag(Strings::iterator & pos, Strings::iterator end);

    /**
     * Offer the positional words collected so far to the next expected
     * argument.
     *
     * @param finish No more words will follow.
     * @return true if the words were consumed.
     */
    virtual bool processArgs(const Strings & args, bool finish);

    virtual void checkArgs() {}

    friend class MultiCommand;
};

/**
 * An `Args` that does something once parsed.
 */
struct Command : virtual public Args
{
    virtual void run() = 0;
};

using Commands = std::map<std::string, std::function<std::shared_ptr<Command>()>>;

/**
 * `<command> <subcommand> [args...]`: the first positional word picks
 * one of `commands`, which parses the rest.
 */
class MultiCommand : virtual public Args
{
public:

    Commands commands;

    /**
     * The subcommand picked by `parseCmdline()`, if any.
     */
    std::optional<std::pair<std::string, std::shared_ptr<Command>>> command;

    MultiCommand(std::string_view commandName, const Commands & commands);

    void printHelp(const std::string & programName, std::ostream & out) override;

protected:

    std::string commandName;

    bool processFlag(Strings::iterator & pos, Strings::iterator end) override;

    bool processArgs(const Strings & args, bool finish) override;

    void checkArgs() override;
};

/**
 * `argv` without the program name.
 */
Strings argvToStrings(int argc, char ** argv);

} // namespace sdbg

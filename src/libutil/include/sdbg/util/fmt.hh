#pragma once
///@file

#include "sdbg/util/ansicolor.hh"

#include <boost/format.hpp>

#include <ostream>
#include <string>
#include <string_view>

namespace sdbg {

/**
 * Missing or surplus arguments produce text, not exceptions.
 */
inline void setExceptions(boost::format & f)
{
    f.exceptions(boost::io::all_error_bits ^ boost::io::too_many_args_bit ^ boost::io::too_few_args_bit);
}

/**
 * Feed `args` into `f` in order.
 */
template<typename... Args>
inline boost::format & formatHelper(boost::format & f, const Args &... args)
{
    (f % ... % args);
    return f;
}

/**
 * `printf`-style formatting with `boost::format` placeholders (`%s`,
 * `%1%`, `%x`...). A lone string is returned as is, so text typed by
 * the user never acts as a format.
 */
inline std::string fmt(std::string_view s)
{
    return std::string(s);
}

inline std::string fmt(const char * s)
{
    return s;
}

inline std::string fmt(const std::string & s)
{
    return s;
}

template<typename... Args>
    requires(sizeof...(Args) > 0)
inline std::string fmt(const std::string & format, const Args &... args)
{
    boost::format f(format);
    setExceptions(f);
    return formatHelper(f, args...).str();
}

/**
 * Prints its value between colour escapes, leaving stream flags such
 * as `std::hex` to apply to the value itself.
 */
template<class T>
struct Highlighted
{
    const T & value;
};

template<class T>
std::ostream & operator<<(std::ostream & out, const Highlighted<T> & h)
{
    return out << ANSI_WARNING << h.value << ANSI_NORMAL;
}

/**
 * The message of an error. Interpolated arguments are highlighted.
 */
class HintFmt
{
    std::string s;

public:

    HintFmt() = default;

    /**
     * Take `literal` as the whole message, without looking for
     * placeholders in it.
     */
    HintFmt(std::string literal)
        : s(std::move(literal))
    {
    }

    HintFmt(const char * literal)
        : s(literal)
    {
    }

    template<typename... Args>
        requires(sizeof...(Args) > 0)
    HintFmt(const std::string & format, const Args &... args)
    {
        boost::format f(format);
        setExceptions(f);
        formatHelper(f, Highlighted<Args>{args}...);
        s = f.str();
    }

    const std::string & str() const
    {
        return s;
    }
};

inline std::ostream & operator<<(std::ostream & out, const HintFmt & hf)
{
    return out << hf.str();
}

} // namespace sdbg

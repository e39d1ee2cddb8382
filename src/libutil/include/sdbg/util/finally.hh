#pragma once
///@file

#include <exception>
#include <utility>

/**
 * Calls `fun` when the scope ends, unless moved from.
 */
template<typename Fn>
class [[nodiscard("a discarded Finally runs immediately")]] Finally
{
    Fn fun;
    bool armed = true;

public:

    Finally(Fn fun)
        : fun(std::move(fun))
    {
    }

    Finally(const Finally &) = delete;

    Finally(Finally && that)
        : fun(std::move(that.fun))
    {
        that.armed = false;
    }

    /**
     * `fun` may throw, but not while another exception is unwinding:
     * that would terminate the program.
     */
    ~Finally() noexcept(false)
    {
        if (armed)
            fun();
    }
};

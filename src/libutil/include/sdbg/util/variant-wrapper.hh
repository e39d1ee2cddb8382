#pragma once
///@file

#include <type_traits>
#include <utility>
#include <variant>

/**
 * For a struct whose only data member is a `std::variant` called
 * `raw`: default the copy and move operations, and construct `raw`
 * from whatever the struct is constructed from.
 */
#define MAKE_WRAPPER_CONSTRUCTOR(CLASS_NAME)                                                                \
    CLASS_NAME(const CLASS_NAME &) = default;                                                               \
    CLASS_NAME(CLASS_NAME &&) = default;                                                                    \
    CLASS_NAME & operator=(const CLASS_NAME &) = default;                                                   \
    CLASS_NAME & operator=(CLASS_NAME &&) = default;                                                        \
                                                                                                            \
    template<typename Arg>                                                                                  \
        requires(!std::is_same_v<std::remove_cvref_t<Arg>, CLASS_NAME>)                                     \
    CLASS_NAME(Arg && arg)                                                                                  \
        : raw(std::forward<Arg>(arg))                                                                       \
    {                                                                                                       \
    }

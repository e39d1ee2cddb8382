#pragma once
///@file

#include <list>
#include <map>
#include <set>
#include <string>
#include <string_view>

namespace sdbg {

typedef std::list<std::string> Strings;

/**
 * Ordered, with `std::string_view` lookups that do not allocate.
 */
using StringMap = std::map<std::string, std::string, std::less<>>;

using StringSet = std::set<std::string, std::less<>>;

typedef std::string Path;
typedef std::string_view PathView;

/**
 * Build a `std::visit` visitor out of lambdas.
 */
template<class... Ts>
struct overloaded : Ts...
{
    using Ts::operator()...;
};

template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace sdbg

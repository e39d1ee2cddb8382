#pragma once
///@file

#include "sdbg/util/types.hh"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sdbg {

/**
 * Split `s` at any of the characters in `separators`. Runs of
 * separators count as one, so there are no empty words.
 */
template<class C>
C tokenizeString(std::string_view s, std::string_view separators = " \t\n\r");

extern template Strings tokenizeString(std::string_view s, std::string_view separators);
extern template std::vector<std::string> tokenizeString(std::string_view s, std::string_view separators);

template<class C>
std::string concatStringsSep(std::string_view sep, const C & ss);

extern template std::string concatStringsSep(std::string_view, const Strings &);
extern template std::string concatStringsSep(std::string_view, const std::vector<std::string> &);

/**
 * Split a command line into words, honouring single quotes, double
 * quotes and backslashes like a POSIX shell. Nothing is expanded.
 *
 * @throws Error if a quote is left open or the line ends in a backslash.
 */
Strings shellSplitString(std::string_view s);

/**
 * `s` without trailing whitespace.
 */
std::string chomp(std::string_view s);

/**
 * `s` without leading or trailing whitespace.
 */
std::string trim(std::string_view s);

bool hasPrefix(std::string_view s, std::string_view prefix);

bool hasSuffix(std::string_view s, std::string_view suffix);

/**
 * Remove the indentation shared by all non-blank lines, so that
 * descriptions can be written as indented raw string literals.
 */
std::string stripIndentation(std::string_view s);

/**
 * Parse a whole string as a decimal integer. Fails on anything else,
 * including a minus sign for an unsigned `N`.
 */
template<class N>
std::optional<N> string2Int(std::string_view s);

template<class N>
std::optional<N> string2Float(std::string_view s);

} // namespace sdbg

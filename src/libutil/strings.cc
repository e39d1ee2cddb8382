#include "sdbg/util/strings.hh"
#include "sdbg/util/error.hh"

#include <algorithm>
#include <limits>

#include <boost/lexical_cast.hpp>

namespace sdbg {

static constexpr std::string_view whitespace = " \t\n\r";

template<class C>
C tokenizeString(std::string_view s, std::string_view separators)
{
    C words;
    for (auto start = s.find_first_not_of(separators); start != s.npos;) {
        auto end = std::min(s.find_first_of(separators, start), s.size());
        words.emplace_back(s.substr(start, end - start));
        start = s.find_first_not_of(separators, end);
    }
    return words;
}

template Strings tokenizeString(std::string_view s, std::string_view separators);
template std::vector<std::string> tokenizeString(std::string_view s, std::string_view separators);

template<class C>
std::string concatStringsSep(std::string_view sep, const C & ss)
{
    std::string res;
    for (auto & s : ss) {
        if (&s != &*ss.begin())
            res += sep;
        res += s;
    }
    return res;
}

template std::string concatStringsSep(std::string_view, const Strings &);
template std::string concatStringsSep(std::string_view, const std::vector<std::string> &);

namespace {

/**
 * The word splitter behind `shellSplitString()`, one character at a
 * time.
 */
struct ShellSplitter
{
    enum { Blank, Plain, Single, Double } state = Blank;
    bool escaped = false;
    std::string word;
    Strings words;

    void add(char c)
    {
        word += c;
        if (state == Blank)
            state = Plain;
    }

    void endWord()
    {
        if (state != Blank)
            words.push_back(std::move(word));
        word.clear();
        state = Blank;
    }

    void feed(char c)
    {
        if (escaped) {
            /* Inside double quotes a backslash only escapes these. */
            if (state == Double && std::string_view("$`\"\\").find(c) == std::string_view::npos)
                word += '\\';
            add(c);
            escaped = false;
            return;
        }

        switch (state) {
        case Single:
            if (c == '\'')
                state = Plain;
            else
                word += c;
            break;
        case Double:
            if (c == '"')
                state = Plain;
            else if (c == '\\')
                escaped = true;
            else
                word += c;
            break;
        case Blank:
        case Plain:
            if (c == ' ' || c == '\t' || c == '\n')
                endWord();
            else if (c == '\\')
                escaped = true;
            else if (c == '\'')
                state = Single;
            else if (c == '"')
                state = Double;
            else
                add(c);
            break;
        }
    }
};

} // namespace

Strings shellSplitString(std::string_view s)
{
    ShellSplitter splitter;
    for (char c : s)
        splitter.feed(c);

    if (splitter.escaped)
        throw Error("trailing backslash");
    if (splitter.state == ShellSplitter::Single)
        throw Error("unterminated single quote");
    if (splitter.state == ShellSplitter::Double)
        throw Error("unterminated double quote");

    splitter.endWord();
    return std::move(splitter.words);
}

std::string chomp(std::string_view s)
{
    auto end = s.find_last_not_of(whitespace);
    return end == s.npos ? "" : std::string(s.substr(0, end + 1));
}

std::string trim(std::string_view s)
{
    auto start = s.find_first_not_of(whitespace);
    if (start == s.npos)
        return "";
    return chomp(s.substr(start));
}

bool hasPrefix(std::string_view s, std::string_view prefix)
{
    return s.substr(0, prefix.size()) == prefix;
}

bool hasSuffix(std::string_view s, std::string_view suffix)
{
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

std::string stripIndentation(std::string_view s)
{
    std::vector<std::string_view> lines;
    for (size_t start = 0; start <= s.size();) {
        auto end = std::min(s.find('\n', start), s.size());
        lines.push_back(s.substr(start, end - start));
        start = end + 1;
    }

    auto blank = [](std::string_view line) { return line.find_first_not_of(whitespace) == line.npos; };

    while (!lines.empty() && blank(lines.front()))
        lines.erase(lines.begin());
    while (!lines.empty() && blank(lines.back()))
        lines.pop_back();

    auto indent = std::numeric_limits<size_t>::max();
    for (auto line : lines)
        if (!blank(line))
            indent = std::min(indent, line.find_first_not_of(' '));

    std::string res;
    for (auto line : lines) {
        if (!blank(line))
            res += line.substr(indent);
        res += '\n';
    }
    return res;
}

template<class N>
std::optional<N> string2Int(std::string_view s)
{
    if (!std::numeric_limits<N>::is_signed && hasPrefix(s, "-"))
        return std::nullopt;
    try {
        return boost::lexical_cast<N>(s.data(), s.size());
    } catch (const boost::bad_lexical_cast &) {
        return std::nullopt;
    }
}

template std::optional<int> string2Int<int>(std::string_view s);
template std::optional<unsigned int> string2Int<unsigned int>(std::string_view s);
template std::optional<long> string2Int<long>(std::string_view s);
template std::optional<unsigned long> string2Int<unsigned long>(std::string_view s);

template<class N>
std::optional<N> string2Float(std::string_view s)
{
    try {
        return boost::lexical_cast<N>(s.data(), s.size());
    } catch (const boost::bad_lexical_cast &) {
        return std::nullopt;
    }
}

template std::optional<long double> string2Float<long double>(std::string_view s);

} // namespace sdbg

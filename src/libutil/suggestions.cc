#include "sdbg/util/suggestions.hh"
#include "sdbg/util/ansicolor.hh"
#include "sdbg/util/terminal.hh"

#include <algorithm>
#include <numeric>
#include <vector>

namespace sdbg {

int levenshteinDistance(std::string_view first, std::string_view second)
{
    /* `row[j]` is the distance between the prefix of `first` seen so
       far and the first `j` characters of `second`. */
    std::vector<int> row(second.size() + 1);
    std::iota(row.begin(), row.end(), 0);

    for (size_t i = 0; i < first.size(); ++i) {
        int diagonal = row[0];
        row[0] = i + 1;
        for (size_t j = 0; j < second.size(); ++j) {
            int above = row[j + 1];
            row[j + 1] = std::min({above + 1, row[j] + 1, diagonal + (first[i] == second[j] ? 0 : 1)});
            diagonal = above;
        }
    }

    return row.back();
}

Suggestions Suggestions::bestMatches(const StringSet & known, std::string_view query)
{
    Suggestions res;
    for (auto & name : known)
        res.suggestions.insert({levenshteinDistance(query, name), name});
    return res;
}

Suggestions Suggestions::trim(size_t limit, int maxDistance) const
{
    Suggestions res;
    for (auto & s : suggestions) {
        if (res.suggestions.size() >= limit || s.distance > maxDistance)
            break;
        res.suggestions.insert(s);
    }
    return res;
}

std::string Suggestion::to_string() const
{
    return ANSI_WARNING + filterANSIEscapes(suggestion) + ANSI_NORMAL;
}

std::string Suggestions::to_string() const
{
    if (suggestions.empty())
        return "";
    if (suggestions.size() == 1)
        return suggestions.begin()->to_string();

    std::string res = "one of ";
    size_t n = 0;
    for (auto & s : suggestions) {
        if (n > 0)
            res += n + 1 == suggestions.size() ? " or " : ", ";
        res += s.to_string();
        ++n;
    }
    return res;
}

} // namespace sdbg

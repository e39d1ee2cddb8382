#pragma once
///@file

#include "sdbg/util/types.hh"

#include <set>
#include <variant>

namespace sdbg {

/**
 * The number of single-character insertions, deletions and
 * substitutions that turn `first` into `second`.
 */
int levenshteinDistance(std::string_view first, std::string_view second);

/**
 * A known name that is close to what the user typed.
 */
struct Suggestion
{
    int distance;
    std::string suggestion;

    std::string to_string() const;

    auto operator<=>(const Suggestion &) const = default;
};

/**
 * Candidate names for a misspelt command or register, closest first.
 */
struct Suggestions
{
    std::set<Suggestion> suggestions;

    /**
     * "`a`", "one of `a` or `b`", "one of `a`, `b` or `c`", or the
     * empty string.
     */
    std::string to_string() const;

    /**
     * Keep at most `limit` candidates that are at most `maxDistance`
     * edits away. Swapping two adjacent letters costs two edits.
     */
    Suggestions trim(size_t limit = 5, int maxDistance = 2) const;

    /**
     * Rank every name in `known` by its distance to `query`.
     */
    static Suggestions bestMatches(const StringSet & known, std::string_view query);
};

/**
 * The result of a lookup by name: the value, or what the user might
 * have meant instead.
 */
template<typename T>
struct OrSuggestions
{
    std::variant<T, Suggestions> raw;

    OrSuggestions(T t)
        : raw(std::move(t))
    {
    }

    static OrSuggestions failed(Suggestions suggestions)
    {
        OrSuggestions res{T{}};
        res.raw = std::move(suggestions);
        return res;
    }

    explicit operator bool() const
    {
        return std::holds_alternative<T>(raw);
    }

    T & operator*()
    {
        return std::get<T>(raw);
    }

    Suggestions getSuggestions() const
    {
        if (auto * suggestions = std::get_if<Suggestions>(&raw))
            return *suggestions;
        return {};
    }
};

} // namespace sdbg

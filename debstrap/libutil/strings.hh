#pragma once
///@file

#include "debstrap/libutil/types.hh"

#include <boost/container/small_vector.hpp>

#include <vector>

namespace debstrap {

/**
 * Split `s` at any of `separators`, dropping empty tokens. `C` is one of
 * `Strings`, `StringSet` or `std::vector<std::string>`.
 */
template<class C> C tokenizeString(std::string_view s, std::string_view separators = " \t\n\r");

template<class C>
std::string concatStringsSep(const std::string_view sep, const C & ss)
{
    std::string s;
    bool first = true;
    for (auto & i : ss) {
        if (!first) s += sep;
        s += i;
        first = false;
    }
    return s;
}

/**
 * Map `fn` over `iterable` and join the results with `separator`.
 */
template<class C, class F>
std::string concatMapStringsSep(std::string_view separator, const C & iterable, F fn)
{
    boost::container::small_vector<std::string, 64> strings;
    for (const auto & elem : iterable)
        strings.push_back(fn(elem));
    return concatStringsSep(separator, strings);
}

std::string trim(std::string_view s, std::string_view whitespace = " \n\r\t");

std::string toLower(std::string s);

/**
 * Quote `s` as a single POSIX shell word.
 */
std::string shellEscape(std::string_view s);

/**
 * Quote `s` for a log line: double quotes around it, with quotes,
 * backslashes and control characters escaped C-style.
 */
std::string debugQuote(std::string_view s);

}

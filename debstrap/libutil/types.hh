#pragma once
///@file

#include <list>
#include <set>
#include <string>
#include <string_view>

namespace debstrap {

typedef std::list<std::string> Strings;
typedef std::set<std::string> StringSet;

typedef std::string Path;
typedef std::string_view PathView;
typedef std::list<Path> Paths;

/**
 * Builds a visitor for `std::visit` out of a set of lambdas.
 */
template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

}

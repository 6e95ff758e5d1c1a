#pragma once
///@file

#include <string>
#include <string_view>

namespace debstrap {

/**
 * Whether stderr should get ANSI colours: it is a terminal other than
 * `TERM=dumb`, or colour is forced. `NO_COLOR` wins over both.
 */
bool shouldANSI();

/**
 * Remove ANSI escape sequences from `s`. Colour sequences (CSI ... m)
 * survive unless `filterAll` is set. Carriage returns and bells are
 * always dropped.
 */
std::string filterANSIEscapes(std::string_view s, bool filterAll = false);

}

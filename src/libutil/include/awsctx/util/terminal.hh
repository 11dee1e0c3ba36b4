#pragma once
///@file

#include <string>
#include <string_view>

namespace awsctx {

/**
 * Determine whether stderr is a terminal that understands ANSI escape
 * sequences. `TERM=dumb` and `NO_COLOR` turn colours off, `FORCE_COLOR`
 * turns them on.
 */
bool isTTY();

/**
 * Remove ANSI escape sequences from `s`. Colour sequences (those ending
 * in 'm') are kept unless `filterAll` is set.
 */
std::string filterANSIEscapes(std::string_view s, bool filterAll = false);

} // namespace awsctx

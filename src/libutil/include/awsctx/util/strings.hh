#pragma once
///@file

#include "awsctx/util/types.hh"

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>

namespace awsctx {

/**
 * Split `s` at any of `separators`, dropping empty tokens.
 */
template<class C>
C tokenizeString(std::string_view s, std::string_view separators = " \t\n\r")
{
    C result;
    for (auto start = s.find_first_not_of(separators); start != s.npos;) {
        auto end = std::min(s.find_first_of(separators, start), s.size());
        result.insert(result.end(), std::string(s.substr(start, end - start)));
        start = s.find_first_not_of(separators, end);
    }
    return result;
}

/**
 * Join `ss` with `sep` between the elements.
 */
template<class C>
std::string concatStringsSep(std::string_view sep, const C & ss)
{
    std::string res;
    for (auto i = ss.begin(); i != ss.end(); ++i) {
        if (i != ss.begin())
            res += sep;
        res += *i;
    }
    return res;
}

/**
 * Remove trailing whitespace.
 */
std::string chomp(std::string_view s);

/**
 * Remove the indentation shared by all non-blank lines of `s`, so that
 * setting descriptions can be written as indented raw strings.
 */
std::string stripIndentation(std::string_view s);

/**
 * Prefix the first line of `s` with `prefix` and every following
 * non-empty line with `init`.
 */
std::string indent(std::string_view prefix, std::string_view init, std::string_view s);

/**
 * Parse a decimal integer, rejecting trailing garbage and, for unsigned
 * `N`, a minus sign.
 */
template<class N>
std::optional<N> string2Int(std::string_view s);

} // namespace awsctx

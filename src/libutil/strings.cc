#include "awsctx/util/strings.hh"

#include <boost/lexical_cast.hpp>

#include <algorithm>
#include <limits>
#include <vector>

namespace awsctx {

static constexpr std::string_view whitespace = " \n\r\t";

std::string chomp(std::string_view s)
{
    auto last = s.find_last_not_of(whitespace);
    return last == s.npos ? "" : std::string(s.substr(0, last + 1));
}

std::string stripIndentation(std::string_view s)
{
    std::vector<std::string_view> lines;
    for (size_t start = 0; start < s.size();) {
        auto eol = std::min(s.find('\n', start), s.size());
        lines.push_back(s.substr(start, eol - start));
        start = eol + 1;
    }

    auto common = std::string_view::npos;
    for (auto line : lines)
        if (auto i = line.find_first_not_of(' '); i != line.npos)
            common = std::min(common, i);

    std::string res;
    for (auto line : lines) {
        if (line.size() > common)
            res += line.substr(common);
        res += '\n';
    }
    return res;
}

std::string indent(std::string_view prefix, std::string_view init, std::string_view s)
{
    std::string res;
    auto lead = prefix;
    for (size_t start = 0; start <= s.size();) {
        auto eol = std::min(s.find('\n', start), s.size());
        if (eol > start) {
            res += lead;
            res += s.substr(start, eol - start);
        }
        if (eol == s.size())
            break;
        res += '\n';
        lead = init;
        start = eol + 1;
    }
    return res;
}

template<class N>
std::optional<N> string2Int(std::string_view s)
{
    if (!std::numeric_limits<N>::is_signed && !s.empty() && s.front() == '-')
        return std::nullopt;
    N n;
    if (!boost::conversion::try_lexical_convert(s.data(), s.size(), n))
        return std::nullopt;
    return n;
}

template std::optional<int> string2Int<int>(std::string_view s);
template std::optional<unsigned int> string2Int<unsigned int>(std::string_view s);
template std::optional<long> string2Int<long>(std::string_view s);
template std::optional<unsigned long> string2Int<unsigned long>(std::string_view s);

} // namespace awsctx

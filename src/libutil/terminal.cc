#include "awsctx/util/terminal.hh"
#include "awsctx/util/environment-variables.hh"

#include <unistd.h>

namespace awsctx {

bool isTTY()
{
    static const bool tty = [] {
        if (getEnv("NO_COLOR"))
            return false;
        if (getEnv("FORCE_COLOR"))
            return true;
        return isatty(STDERR_FILENO) && getEnv("TERM").value_or("dumb") != "dumb";
    }();
    return tty;
}

static bool inRange(char c, char lo, char hi)
{
    return c >= lo && c <= hi;
}

std::string filterANSIEscapes(std::string_view s, bool filterAll)
{
    std::string res;
    res.reserve(s.size());

    for (size_t i = 0; i < s.size();) {
        if (s[i] == '\r' || s[i] == '\a') {
            i++;
            continue;
        }

        if (s[i] != '\e') {
            res += s[i++];
            continue;
        }

        auto start = i++;
        bool isSGR = false;
        if (i < s.size() && s[i] == '[') {
            /* CSI: parameter bytes, intermediate bytes, one final byte. */
            i++;
            while (i < s.size() && inRange(s[i], 0x30, 0x3f))
                i++;
            while (i < s.size() && inRange(s[i], 0x20, 0x2f))
                i++;
            if (i < s.size() && inRange(s[i], 0x40, 0x7e))
                isSGR = s[i++] == 'm';
        } else if (i < s.size() && inRange(s[i], 0x40, 0x5f))
            i++;

        if (isSGR && !filterAll)
            res += s.substr(start, i - start);
    }

    return res;
}

} // namespace awsctx

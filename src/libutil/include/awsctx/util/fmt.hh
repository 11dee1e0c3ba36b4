#pragma once
///@file

#include <boost/format.hpp>
#include <ostream>
#include <string>
#include <string_view>

#include "awsctx/util/ansicolor.hh"

namespace awsctx {

/**
 * Feed `args...` to the `boost::format` object `f` in order.
 */
template<class F, typename... Args>
inline void formatHelper(F & f, const Args &... args)
{
    ((f % args), ...);
}

/**
 * Surplus or missing arguments are tolerated; malformed format strings
 * still throw.
 */
inline void setExceptions(boost::format & fmt)
{
    fmt.exceptions(boost::io::all_error_bits ^ boost::io::too_many_args_bit ^ boost::io::too_few_args_bit);
}

/**
 * `boost::format` in a function call. A lone string is returned as is,
 * so text containing `%` can be logged without escaping.
 */
inline std::string fmt(std::string_view s)
{
    return std::string(s);
}

inline std::string fmt(const char * s)
{
    return s;
}

inline std::string fmt(const std::string & s)
{
    return s;
}

template<typename... Args>
inline std::string fmt(const std::string & fs, const Args &... args)
{
    boost::format f(fs);
    setExceptions(f);
    formatHelper(f, args...);
    return f.str();
}

/**
 * A format argument printed in the highlight colour.
 */
template<class T>
struct Magenta
{
    const T & value;
};

template<class T>
std::ostream & operator<<(std::ostream & out, const Magenta<T> & m)
{
    return out << ANSI_WARNING << m.value << ANSI_NORMAL;
}

/**
 * A format argument printed as is.
 */
template<class T>
struct Uncolored
{
    Uncolored(const T & value)
        : value(value)
    {
    }

    const T & value;
};

/**
 * The message of an error or trace. Interpolated arguments are
 * highlighted unless wrapped in `Uncolored`, so that names and values
 * stand out from the surrounding text.
 */
class HintFmt
{
    boost::format fmt;

public:

    /**
     * A message without placeholders; `%` is taken literally.
     */
    HintFmt(const std::string & literal)
        : HintFmt("%s", Uncolored(literal))
    {
    }

    template<typename... Args>
    HintFmt(const std::string & format, const Args &... args)
        : fmt(format)
    {
        setExceptions(fmt);
        formatHelper(*this, args...);
    }

    template<class T>
    HintFmt & operator%(const T & value)
    {
        fmt % Magenta<T>{value};
        return *this;
    }

    template<class T>
    HintFmt & operator%(const Uncolored<T> & value)
    {
        fmt % value.value;
        return *this;
    }

    std::string str() const
    {
        return fmt.str();
    }
};

std::ostream & operator<<(std::ostream & os, const HintFmt & hf);

} // namespace awsctx

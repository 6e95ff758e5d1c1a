#pragma once
///@file String formatting on top of boost::format.

#include <boost/format.hpp>
#include <ostream>
#include <string>

#include "debstrap/libutil/ansicolor.hh"

namespace debstrap {

/**
 * Wraps a `HintFmt` argument that is printed as-is. Every other argument
 * is highlighted in magenta.
 */
template<class T>
struct Uncolored
{
    Uncolored(const T & s) : value(s) {}
    const T & value;
};

template<class T>
std::ostream & operator<<(std::ostream & out, const Uncolored<T> & u)
{
    return out << u.value;
}

namespace detail {

template<class T>
struct Highlighted
{
    const T & value;
};

template<class T>
std::ostream & operator<<(std::ostream & out, const Highlighted<T> & h)
{
    return out << ANSI_MAGENTA << h.value << ANSI_NORMAL;
}

/**
 * A `boost::format` that tolerates argument count mismatches but still
 * throws on a malformed format string.
 */
boost::format makeFormat(const std::string & format);

[[noreturn]] void badFormatString(const std::string & format, size_t nargs);

template<class T>
void addHinted(boost::format & f, const T & value)
{
    f % Highlighted<T>{value};
}

template<class T>
void addHinted(boost::format & f, const Uncolored<T> & value)
{
    f % value.value;
}

}

/**
 * Format `format` with `args` into a string. A lone argument is returned
 * untouched, so text containing `%` never reaches boost::format.
 */
inline std::string fmt(const std::string & s)
{
    return s;
}

inline std::string fmt(const char * s)
{
    return s;
}

template<typename... Args>
std::string fmt(const std::string & format, const Args &... args)
{
    try {
        auto f = detail::makeFormat(format);
        (f % ... % args);
        return f.str();
    } catch (boost::io::format_error &) {
        detail::badFormatString(format, sizeof...(args));
    }
}

/**
 * A formatted message for the user. Interpolated arguments are shown in
 * magenta unless wrapped in `Uncolored`.
 */
class HintFmt
{
    std::string text;

public:
    HintFmt(const std::string & literal) : text(literal) {}

    template<typename... Args>
    HintFmt(const std::string & format, const Args &... args)
    {
        try {
            auto f = detail::makeFormat(format);
            (detail::addHinted(f, args), ...);
            if (f.remaining_args() != 0)
                detail::badFormatString(format, sizeof...(args));
            text = f.str();
        } catch (boost::io::format_error &) {
            detail::badFormatString(format, sizeof...(args));
        }
    }

    std::string str() const
    {
        return text;
    }
};

std::ostream & operator<<(std::ostream & os, const HintFmt & hf);

}

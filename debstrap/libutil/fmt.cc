#include "debstrap/libutil/fmt.hh"

#include <exception>
#include <iostream>

namespace debstrap {

boost::format detail::makeFormat(const std::string & format)
{
    boost::format f(format);
    f.exceptions(
        boost::io::all_error_bits ^ boost::io::too_many_args_bit ^ boost::io::too_few_args_bit);
    return f;
}

void detail::badFormatString(const std::string & format, size_t nargs)
{
    // A broken format string is a programming error, not a runtime condition.
    std::cerr << "bad format string '" << format << "' with " << nargs << " arguments\n";
    std::terminate();
}

std::ostream & operator<<(std::ostream & os, const HintFmt & hf)
{
    return os << hf.str();
}

}

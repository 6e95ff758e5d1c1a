#include "debstrap/libutil/strings.hh"
#include "debstrap/libutil/fmt.hh"

#include <cctype>
#include <vector>

namespace debstrap {

template<class C> C tokenizeString(std::string_view s, std::string_view separators)
{
    C result;
    for (auto pos = s.find_first_not_of(separators); pos != s.npos; ) {
        auto end = std::min(s.find_first_of(separators, pos), s.size());
        result.insert(result.end(), std::string(s.substr(pos, end - pos)));
        pos = s.find_first_not_of(separators, end);
    }
    return result;
}

template Strings tokenizeString(std::string_view s, std::string_view separators);
template StringSet tokenizeString(std::string_view s, std::string_view separators);
template std::vector<std::string> tokenizeString(std::string_view s, std::string_view separators);

std::string trim(std::string_view s, std::string_view whitespace)
{
    auto first = s.find_first_not_of(whitespace);
    if (first == s.npos) return "";
    auto last = s.find_last_not_of(whitespace);
    return std::string(s.substr(first, last - first + 1));
}

std::string toLower(std::string s)
{
    for (auto & c : s)
        c = std::tolower(static_cast<unsigned char>(c));
    return s;
}

std::string shellEscape(std::string_view s)
{
    std::string r = "'";
    for (auto c : s) {
        if (c == '\'')
            r += "'\\''";
        else
            r += c;
    }
    r += '\'';
    return r;
}

std::string debugQuote(std::string_view s)
{
    std::string r = "\"";
    for (auto c : s) {
        switch (c) {
        case '"': r += "\\\""; break;
        case '\\': r += "\\\\"; break;
        case '\n': r += "\\n"; break;
        case '\t': r += "\\t"; break;
        case '\r': r += "\\r"; break;
        default:
            if (std::iscntrl(static_cast<unsigned char>(c)))
                r += fmt("\\x%02x", static_cast<unsigned int>(static_cast<unsigned char>(c)));
            else
                r += c;
        }
    }
    r += '"';
    return r;
}

}

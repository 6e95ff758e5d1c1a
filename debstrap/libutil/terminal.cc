#include "debstrap/libutil/terminal.hh"
#include "debstrap/libutil/environment-variables.hh"

#include <unistd.h>

namespace debstrap {

bool shouldANSI()
{
    static const bool ansi = [] {
        if (getEnv("NO_COLOR") || getEnv("NOCOLOR"))
            return false;
        if (getEnv("CLICOLOR_FORCE") || getEnv("FORCE_COLOR"))
            return true;
        return isatty(STDERR_FILENO) && getEnv("TERM").value_or("dumb") != "dumb";
    }();
    return ansi;
}

std::string filterANSIEscapes(std::string_view s, bool filterAll)
{
    std::string res;
    size_t i = 0;

    while (i < s.size()) {
        char c = s[i];

        if (c == '\e') {
            size_t start = i++;
            if (i < s.size() && s[i] == '[') {
                i++;
                // Parameter and intermediate bytes, then one final byte.
                while (i < s.size() && s[i] >= 0x20 && s[i] <= 0x3f) i++;
                char last = 0;
                if (i < s.size() && s[i] >= 0x40 && s[i] <= 0x7e) last = s[i++];
                if (!filterAll && last == 'm')
                    res += s.substr(start, i - start);
            } else if (i < s.size() && !(s[i] & 0x80)) {
                // Two-byte escape.
                i++;
            }
        } else {
            if (c != '\r' && c != '\a') res += c;
            i++;
        }
    }

    return res;
}

}

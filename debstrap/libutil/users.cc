#include "debstrap/libutil/users.hh"
#include "debstrap/libutil/environment-variables.hh"
#include "debstrap/libutil/strings.hh"

#include <optional>
#include <pwd.h>
#include <unistd.h>

namespace debstrap {

/* $HOME, falling back to the passwd entry of the effective user. */
static std::optional<Path> homeDir()
{
    if (auto home = getEnvNonEmpty("HOME"))
        return home;

    std::vector<char> buf(16384);
    struct passwd pwbuf;
    struct passwd * pw;
    if (getpwuid_r(geteuid(), &pwbuf, buf.data(), buf.size(), &pw) != 0 || !pw || !pw->pw_dir || !pw->pw_dir[0])
        return std::nullopt;
    return pw->pw_dir;
}

std::vector<Path> getConfigDirs()
{
    auto result = tokenizeString<std::vector<Path>>(getEnv("XDG_CONFIG_DIRS").value_or("/etc/xdg"), ":");
    if (auto configHome = getEnvNonEmpty("XDG_CONFIG_HOME"))
        result.insert(result.begin(), *configHome);
    else if (auto home = homeDir())
        result.insert(result.begin(), *home + "/.config");
    return result;
}

}

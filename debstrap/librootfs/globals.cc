#include "debstrap/librootfs/globals.hh"
#include "debstrap/libutil/environment-variables.hh"
#include "debstrap/libutil/file-system.hh"
#include "debstrap/libutil/logging.hh"
#include "debstrap/libutil/strings.hh"
#include "debstrap/libutil/users.hh"

#include <cerrno>

namespace debstrap {

Settings settings;

static GlobalConfig::Register rSettings(&settings);

Settings::Settings()
    : debstrapConfDir(canonPath(getEnvNonEmpty("DEBSTRAP_CONF_DIR").value_or("/etc/debstrap")))
    , userConfFiles(getUserConfigFiles())
{
}

void loadConfFile()
{
    auto applyConfigFile = [&](const ApplyConfigOptions & options) {
        std::string contents;
        try {
            contents = readFile(*options.path);
        } catch (SysError & e) {
            if (e.errNo != ENOENT)
                printTaggedWarning("could not read configuration file '%s': %s", *options.path, e.info().msg.str());
            return;
        }
        globalConfig.applyConfig(contents, options);
    };

    applyConfigFile(ApplyConfigOptions{.path = settings.debstrapConfDir + "/debstrap.conf"});

    auto & files = settings.userConfFiles;
    for (auto file = files.rbegin(); file != files.rend(); file++)
        applyConfigFile(ApplyConfigOptions{.path = *file});

    auto confEnv = getEnv("DEBSTRAP_CONFIG");
    if (confEnv.has_value())
        globalConfig.applyConfig(confEnv.value(), ApplyConfigOptions{});
}

std::vector<Path> getUserConfigFiles()
{
    auto confFiles = getEnv("DEBSTRAP_USER_CONF_FILES");
    if (confFiles.has_value())
        return tokenizeString<std::vector<std::string>>(confFiles.value(), ":");

    std::vector<Path> files;
    for (auto & dir : getConfigDirs())
        files.push_back(dir + "/debstrap/debstrap.conf");
    return files;
}

}

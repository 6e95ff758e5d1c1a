#include "debstrap/libutil/config.hh"
#include "debstrap/libutil/error.hh"
#include "debstrap/libutil/file-system.hh"
#include "debstrap/libutil/strings.hh"

#include <vector>

namespace debstrap {

static void parseConfigLines(
    const std::string & contents,
    const ApplyConfigOptions & options,
    std::vector<std::pair<std::string, std::string>> & assignments)
{
    for (auto line : tokenizeString<std::vector<std::string>>(contents, "\n")) {
        if (auto hash = line.find('#'); hash != line.npos)
            line.resize(hash);

        auto tokens = tokenizeString<std::vector<std::string>>(line);
        if (tokens.empty()) continue;

        bool isInclude = tokens[0] == "include" || tokens[0] == "!include";
        if (isInclude ? tokens.size() != 2 : tokens.size() < 2 || tokens[1] != "=")
            throw UsageError("illegal configuration line '%1%' in '%2%'", line, options.display());

        if (isInclude) {
            if (!options.path)
                throw UsageError("can only include configuration '%1%' from files", tokens[1]);
            auto included = absPath(tokens[1], dirOf(*options.path));
            if (pathExists(included))
                parseConfigLines(readFile(included), {.path = included}, assignments);
            else if (tokens[0] == "include")
                throw Error("file '%1%' included from '%2%' not found", included, *options.path);
            continue;
        }

        assignments.emplace_back(
            tokens[0], concatStringsSep(" ", std::vector<std::string>(tokens.begin() + 2, tokens.end())));
    }
}

void AbstractConfig::applyConfig(const std::string & contents, const ApplyConfigOptions & options)
{
    /* Parse everything first, so that a malformed file changes nothing. */
    std::vector<std::pair<std::string, std::string>> assignments;
    parseConfigLines(contents, options, assignments);

    for (auto & [name, value] : assignments)
        set(name, value);
}

bool Config::set(const std::string & name, const std::string & value)
{
    if (auto i = settings.find(name); i != settings.end()) {
        i->second->set(value, false);
        return true;
    }
    if (name.starts_with("extra-")) {
        auto i = settings.find(name.substr(6));
        if (i != settings.end() && i->second->isAppendable()) {
            i->second->set(value, true);
            return true;
        }
    }
    return false;
}

void Config::addSetting(AbstractSetting * setting)
{
    settings.emplace(setting->name, setting);
    for (auto & alias : setting->aliases)
        settings.emplace(alias, setting);
}

template<> void Setting<std::string>::set(const std::string & str, bool append)
{
    value = str;
}

template<> void Setting<bool>::set(const std::string & str, bool append)
{
    if (str == "true" || str == "yes" || str == "1")
        value = true;
    else if (str == "false" || str == "no" || str == "0")
        value = false;
    else
        throw UsageError("Boolean setting '%s' has invalid value '%s'", name, str);
}

template<> void Setting<Strings>::set(const std::string & str, bool append)
{
    if (!append) value.clear();
    value.splice(value.end(), tokenizeString<Strings>(str));
}

static std::vector<Config *> & configRegistrations()
{
    static std::vector<Config *> registrations;
    return registrations;
}

bool GlobalConfig::set(const std::string & name, const std::string & value)
{
    for (auto config : configRegistrations())
        if (config->set(name, value)) return true;
    return false;
}

GlobalConfig::Register::Register(Config * config)
{
    configRegistrations().push_back(config);
}

GlobalConfig globalConfig;

}

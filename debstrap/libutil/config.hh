#pragma once
/**
 * @file
 *
 * Named settings read from `name = value` configuration files.
 *
 * A `Config` is a set of `Setting`s that register themselves with it on
 * construction:
 *
 *   struct MyConfig : Config {
 *       Setting<std::string> shell{this, "/bin/sh", "default-shell", "The shell."};
 *   };
 *
 * Configs registered with `GlobalConfig::Register` can then be set by
 * name through `globalConfig`, from `debstrap.conf` or `--option`.
 */

#include "debstrap/libutil/types.hh"

#include <map>
#include <optional>
#include <set>
#include <type_traits>

namespace debstrap {

struct ApplyConfigOptions
{
    /**
     * The file the configuration was read from. `include` directives
     * are resolved relative to it, and are rejected without it.
     */
    std::optional<Path> path = std::nullopt;

    std::string display() const
    {
        return path ? *path : "<inline configuration>";
    }
};

class AbstractConfig
{
public:
    virtual ~AbstractConfig() = default;

    /**
     * Set the setting called `name`. A `extra-` prefix appends to list
     * settings instead of replacing them. Returns false if no such
     * setting exists.
     */
    virtual bool set(const std::string & name, const std::string & value) = 0;

    /**
     * Apply `name = value` lines from `contents`. `#` starts a comment,
     * and `include path` (or `!include path`, which tolerates a missing
     * file) reads another file. Unknown names are ignored.
     */
    void applyConfig(const std::string & contents, const ApplyConfigOptions & options = {});
};

class AbstractSetting
{
public:
    const std::string name;
    const std::string description;
    const std::set<std::string> aliases;

    virtual ~AbstractSetting() = default;

    /**
     * Parse `str` into the setting. `append` is only passed for
     * appendable settings.
     */
    virtual void set(const std::string & str, bool append) = 0;

    virtual bool isAppendable() const = 0;

protected:
    AbstractSetting(std::string name, std::string description, std::set<std::string> aliases)
        : name(std::move(name))
        , description(std::move(description))
        , aliases(std::move(aliases))
    { }
};

class Config : public AbstractConfig
{
    /** Keyed by name and by every alias. */
    std::map<std::string, AbstractSetting *> settings;

public:
    bool set(const std::string & name, const std::string & value) override;

    void addSetting(AbstractSetting * setting);
};

/**
 * A setting of type `T`. `std::string`, `bool` and `Strings` are
 * supported; only `Strings` can be appended to.
 */
template<typename T>
class Setting : public AbstractSetting
{
    T value;

public:
    Setting(Config * config,
        const T & def,
        const std::string & name,
        const std::string & description,
        const std::set<std::string> & aliases = {})
        : AbstractSetting(name, description, aliases)
        , value(def)
    {
        config->addSetting(this);
    }

    const T & get() const { return value; }
    operator const T &() const { return value; }
    void operator =(const T & v) { value = v; }

    void set(const std::string & str, bool append) override;

    bool isAppendable() const override
    {
        return std::is_same_v<T, Strings>;
    }
};

template<> void Setting<std::string>::set(const std::string & str, bool append);
template<> void Setting<bool>::set(const std::string & str, bool append);
template<> void Setting<Strings>::set(const std::string & str, bool append);

/**
 * The union of every registered `Config`, so that a setting can be set
 * by name without knowing which library defines it.
 */
struct GlobalConfig : public AbstractConfig
{
    bool set(const std::string & name, const std::string & value) override;

    struct Register
    {
        Register(Config * config);
    };
};

extern GlobalConfig globalConfig;

}

#include "debstrap/librootfs/profile.hh"
#include "debstrap/librootfs/errors.hh"
#include "debstrap/librootfs/json-fields.hh"
#include "debstrap/libutil/file-system.hh"
#include "debstrap/libutil/json.hh"
#include "debstrap/libutil/logging.hh"

#include <sys/stat.h>

namespace debstrap {

ProfileDefaults ProfileDefaults::parse(const JSON & json)
{
    checkObjectFields(json, "defaults", {"privilege", "isolation", "mitamae"});

    ProfileDefaults res;

    if (auto privilege = get(json, "privilege"))
        res.privilege = parsePrivilegeDefaults(*privilege);

    if (auto isolation = get(json, "isolation"); isolation && !isolation->is_null())
        res.isolation = IsolationConfig::parse(*isolation);

    if (auto mitamae = get(json, "mitamae"); mitamae && !mitamae->is_null()) {
        if (!mitamae->is_object())
            throw ConfigError("defaults.mitamae must be an object mapping architectures to binaries");
        for (auto & [arch, binary] : mitamae->items()) {
            if (!binary.is_string())
                throw ConfigError("defaults.mitamae.%s must be a string, got %s", arch, binary.type_name());
            res.mitamae.emplace(arch, binary.get<std::string>());
        }
    }

    return res;
}

JSON ProfileDefaults::toJSON() const
{
    auto res = JSON::object();
    if (privilege)
        res["privilege"] = JSON{{"method", std::string(showPrivilegeMethod(privilege->method))}};
    res["isolation"] = isolation.toJSON();
    if (!mitamae.empty())
        res["mitamae"] = mitamae;
    return res;
}

static Path absolutize(const Path & path, const Path & baseDir)
{
    if (path.empty() || path.starts_with("/")) return path;
    return canonPath(baseDir + "/" + path);
}

void Profile::resolvePaths(const Path & baseDir)
{
    dir = absolutize(dir, baseDir);
    for (auto & [arch, binary] : defaults.mitamae)
        binary = absolutize(binary, baseDir);
    for (auto & task : provision)
        task.resolvePaths(baseDir);
}

void Profile::resolve(const std::string & arch)
{
    bootstrap.privilege.resolveInPlace(defaults.privilege);
    for (auto & task : provision)
        task.resolveSettings(defaults.isolation, defaults.privilege, defaults.mitamae, arch);
    for (auto & task : assemble)
        task.resolveSettings(defaults.privilege);
}

void Profile::validate() const
{
    if (auto st = maybeStat(dir); st && !S_ISDIR(st->st_mode))
        throw ValidationError("dir must be a directory: %s", dir);

    auto p = pipeline();

    if (auto mount = p.mountTask(); mount && mount->hasMounts()) {
        if (!defaults.privilege)
            throw ValidationError("mount tasks require defaults.privilege.method to be configured");
        if (defaults.isolation.type != IsolationType::Chroot)
            throw ValidationError("mount tasks require chroot as the default isolation");
    }

    p.validate();

    if (!p.empty()) {
        auto output = bootstrap.rootfsOutput(dir);
        if (auto nonDir = std::get_if<RootfsOutput::NonDirectory>(&output.raw))
            throw ValidationError(
                "provisioners are specified but bootstrap output is not a directory: %s. "
                "Provisioners require a directory-based bootstrap target. "
                "For archive-based targets (tar, squashfs, etc.), consider using backend-specific "
                "hooks instead or change the output format to directory.",
                nonDir->reason);
    }
}

template<typename Task>
static std::vector<Task> parseTaskList(const JSON & json, const std::string & key)
{
    std::vector<Task> res;
    auto list = get(json, key);
    if (!list || list->is_null())
        return res;
    if (!list->is_array())
        throw ConfigError("'%s' must be a list of tasks, got %s", key, list->type_name());
    size_t index = 0;
    for (auto & item : *list) {
        ++index;
        try {
            res.push_back(Task::parse(item));
        } catch (Error & e) {
            e.addTrace("while parsing %s task %d", key, index);
            throw;
        }
    }
    return res;
}

Profile Profile::parse(const JSON & json)
{
    checkObjectFields(json, "profile", {"dir", "defaults", "bootstrap", "prepare", "provision", "assemble"});

    auto bootstrap = get(json, "bootstrap");
    if (!bootstrap)
        throw ConfigError("profile requires a 'bootstrap' section");

    auto defaults = get(json, "defaults");

    return Profile{
        .dir = stringField(json, "dir", "profile"),
        .defaults = defaults && !defaults->is_null() ? ProfileDefaults::parse(*defaults) : ProfileDefaults{},
        .bootstrap = Bootstrap::parse(*bootstrap),
        .prepare = parseTaskList<PrepareTask>(json, "prepare"),
        .provision = parseTaskList<ProvisionTask>(json, "provision"),
        .assemble = parseTaskList<AssembleTask>(json, "assemble"),
    };
}

JSON Profile::toJSON() const
{
    auto tasks = [](auto & list) {
        auto res = JSON::array();
        for (auto & t : list)
            res.push_back(t.toJSON());
        return res;
    };

    auto res = JSON::object();
    res["dir"] = dir;
    res["defaults"] = defaults.toJSON();
    res["bootstrap"] = bootstrap.toJSON();
    res["prepare"] = tasks(prepare);
    res["provision"] = tasks(provision);
    res["assemble"] = tasks(assemble);
    return res;
}

Profile loadProfile(const Path & path)
{
    std::string contents;
    try {
        contents = readFile(path);
    } catch (SysError & e) {
        throw IoError(fmt("failed to load file: %s", path), e.errNo);
    }

    auto profile = [&]() {
        try {
            return Profile::parse(json::parse(contents, fmt("profile %s", path)));
        } catch (Error & e) {
            e.addTrace("while loading profile '%s'", path);
            throw;
        }
    }();

    profile.resolvePaths(dirOf(absPath(path)));
    debug("loaded profile from %s", path);
    return profile;
}

}

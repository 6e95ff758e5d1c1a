#include "debstrap/librootfs/prepare.hh"
#include "debstrap/librootfs/errors.hh"
#include "debstrap/librootfs/json-fields.hh"
#include "debstrap/libutil/json.hh"

namespace debstrap {

std::string_view MountTask::name() const
{
    if (preset)
        return mounts.empty() ? "preset" : "preset+custom";
    return mounts.empty() ? "empty" : "custom";
}

std::vector<MountEntry> MountTask::resolvedMounts() const
{
    auto entries = preset ? presetEntries(*preset) : std::vector<MountEntry>{};

    std::vector<bool> used(mounts.size(), false);
    for (auto & entry : entries) {
        for (size_t i = 0; i < mounts.size(); ++i) {
            if (!used[i] && mounts[i].target == entry.target) {
                entry = mounts[i];
                used[i] = true;
                break;
            }
        }
    }

    for (size_t i = 0; i < mounts.size(); ++i)
        if (!used[i])
            entries.push_back(mounts[i]);

    return entries;
}

void MountTask::validate() const
{
    StringSet seen;
    for (auto & entry : mounts)
        if (!seen.insert(entry.target).second)
            throw ValidationError("duplicate mount target '%s' in custom mounts is not allowed", entry.target);

    auto resolved = resolvedMounts();
    for (auto & entry : resolved)
        entry.validate();

    validateMountOrder(resolved);
}

MountTask MountTask::parse(const JSON & json)
{
    checkObjectFields(json, "mount task", {"type", "preset", "mounts"});

    MountTask task;
    if (auto preset = optionalStringField(json, "preset", "mount task"))
        task.preset = parseMountPreset(*preset);

    if (auto mounts = get(json, "mounts"); mounts && !mounts->is_null()) {
        if (!mounts->is_array())
            throw ConfigError("'mounts' in mount task must be a list, got %s", mounts->type_name());
        for (auto & entry : *mounts)
            task.mounts.push_back(MountEntry::parse(entry));
    }

    return task;
}

JSON MountTask::toJSON() const
{
    auto res = JSON::object();
    res["type"] = "mount";
    if (preset)
        res["preset"] = std::string(showMountPreset(*preset));
    if (!mounts.empty()) {
        auto list = JSON::array();
        for (auto & entry : mounts)
            list.push_back(entry.toJSON());
        res["mounts"] = std::move(list);
    }
    return res;
}

ResolvConfTask ResolvConfTask::parse(const JSON & json)
{
    checkObjectFields(json, "resolv_conf task", {"type", "copy", "name_servers", "search"});
    return ResolvConfTask{
        .config = {
            .copy = boolField(json, "copy", "resolv_conf task", false),
            .nameServers = stringListField(json, "name_servers", "resolv_conf task"),
            .search = stringListField(json, "search", "resolv_conf task"),
        },
    };
}

JSON ResolvConfTask::toJSON() const
{
    auto res = JSON::object();
    res["type"] = "resolv_conf";
    if (config.copy)
        res["copy"] = true;
    if (!config.nameServers.empty())
        res["name_servers"] = config.nameServers;
    if (!config.search.empty())
        res["search"] = config.search;
    return res;
}

std::string PrepareTask::name() const
{
    return std::visit([](auto & t) { return std::string(t.name()); }, raw);
}

std::string_view PrepareTask::typeName() const
{
    return std::visit(overloaded {
        [](const MountTask &) { return std::string_view("mount"); },
        [](const ResolvConfTask &) { return std::string_view("resolv_conf"); },
    }, raw);
}

void PrepareTask::validate() const
{
    std::visit([](auto & t) { t.validate(); }, raw);
}

PrepareTask PrepareTask::parse(const JSON & json)
{
    auto type = stringField(json, "type", "prepare task");
    if (type == "mount")
        return PrepareTask{MountTask::parse(json)};
    if (type == "resolv_conf")
        return PrepareTask{ResolvConfTask::parse(json)};
    throw ConfigError("unknown prepare task type '%s', expected 'mount' or 'resolv_conf'", type);
}

JSON PrepareTask::toJSON() const
{
    return std::visit([](auto & t) { return t.toJSON(); }, raw);
}

}

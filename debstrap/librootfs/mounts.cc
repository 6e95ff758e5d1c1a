#include "debstrap/librootfs/mounts.hh"
#include "debstrap/librootfs/errors.hh"
#include "debstrap/librootfs/json-fields.hh"
#include "debstrap/libutil/file-system.hh"
#include "debstrap/libutil/json.hh"
#include "debstrap/libutil/logging.hh"
#include "debstrap/libutil/strings.hh"

#include <algorithm>

namespace debstrap {

static const StringSet pseudoFilesystems = {
    "proc",
    "sysfs",
    "devpts",
    "tmpfs",
    "devtmpfs",
    "mqueue",
    "hugetlbfs",
    "securityfs",
    "cgroup",
    "cgroup2",
};

bool MountEntry::isPseudoFilesystem() const
{
    return pseudoFilesystems.contains(source);
}

bool MountEntry::isBindMount() const
{
    return std::any_of(options.begin(), options.end(), [](auto & o) {
        return o == "bind" || o == "rbind";
    });
}

static bool hasParentComponent(std::string_view path)
{
    for (auto & component : tokenizeString<Strings>(path, "/"))
        if (component == "..") return true;
    return false;
}

void MountEntry::validate() const
{
    if (!target.starts_with("/"))
        throw ValidationError("mount target must be an absolute path: %s", target);
    if (hasParentComponent(target))
        throw ValidationError(
            "mount target '%s' contains '..' components, which is not allowed for security reasons",
            target);
    if (source.empty())
        throw ValidationError("mount source must not be empty for target %s", target);

    if (isBindMount()) {
        if (!pathExists(source))
            throw ValidationError("bind mount source '%s' does not exist on host", source);
    } else if (!isPseudoFilesystem()) {
        if (!pathExists(source))
            throw ValidationError("mount source '%s' does not exist on host", source);
    }
}

CommandSpec MountEntry::mountCommand(const Path & absTarget, std::optional<PrivilegeMethod> privilege) const
{
    Strings args;
    if (isPseudoFilesystem()) {
        args.push_back("-t");
        args.push_back(source);
    }
    if (!options.empty()) {
        args.push_back("-o");
        args.push_back(concatStringsSep(",", options));
    }
    args.push_back(source);
    args.push_back(absTarget);
    return CommandSpec{.command = "mount", .args = std::move(args), .privilege = privilege};
}

CommandSpec MountEntry::umountCommand(const Path & absTarget, std::optional<PrivilegeMethod> privilege) const
{
    return CommandSpec{.command = "umount", .args = {absTarget}, .privilege = privilege};
}

MountEntry MountEntry::parse(const JSON & json)
{
    checkObjectFields(json, "mount entry", {"source", "target", "options"});
    return MountEntry{
        .source = stringField(json, "source", "mount entry"),
        .target = stringField(json, "target", "mount entry"),
        .options = stringListField(json, "options", "mount entry"),
    };
}

JSON MountEntry::toJSON() const
{
    auto res = JSON::object();
    res["source"] = source;
    res["target"] = target;
    if (!options.empty())
        res["options"] = options;
    return res;
}

std::string_view showMountPreset(MountPreset preset)
{
    switch (preset) {
    case MountPreset::Recommends:
        return "recommends";
    }
    std::terminate();
}

MountPreset parseMountPreset(std::string_view s)
{
    if (s == "recommends") return MountPreset::Recommends;
    throw ConfigError("unknown mount preset '%s', expected 'recommends'", s);
}

std::vector<MountEntry> presetEntries(MountPreset preset)
{
    switch (preset) {
    case MountPreset::Recommends:
        return {
            {.source = "proc", .target = "/proc"},
            {.source = "sysfs", .target = "/sys"},
            {.source = "devtmpfs", .target = "/dev"},
            {.source = "devpts", .target = "/dev/pts", .options = {"gid=5", "mode=620"}},
            {.source = "tmpfs", .target = "/tmp"},
            {.source = "tmpfs", .target = "/run"},
        };
    }
    std::terminate();
}

/**
 * Lexically, `parent` is a proper ancestor of `child`.
 */
static bool isAncestor(std::string_view parent, std::string_view child)
{
    while (parent.size() > 1 && parent.ends_with('/'))
        parent.remove_suffix(1);
    while (child.size() > 1 && child.ends_with('/'))
        child.remove_suffix(1);
    if (parent == child) return false;
    if (parent == "/") return true;
    return child.starts_with(parent) && child.size() > parent.size() && child[parent.size()] == '/';
}

void validateMountOrder(const std::vector<MountEntry> & entries)
{
    for (size_t i = 0; i < entries.size(); ++i)
        for (size_t j = i + 1; j < entries.size(); ++j)
            if (isAncestor(entries[j].target, entries[i].target))
                throw ValidationError(
                    "mount order error: '%s' must come after '%s'",
                    entries[i].target,
                    entries[j].target);
}

RootfsMounts::RootfsMounts(
    Path rootfs,
    std::vector<MountEntry> entries,
    CommandExecutor & executor,
    FileSystem & fs,
    std::optional<PrivilegeMethod> privilege,
    bool dryRun)
    : rootfs(std::move(rootfs))
    , entries(std::move(entries))
    , executor(executor)
    , fs(fs)
    , privilege(privilege)
    , dryRun(dryRun)
{
}

RootfsMounts::~RootfsMounts()
{
    if (tornDown || applied.empty()) return;
    try {
        unmount();
    } catch (Error & e) {
        printError(
            "failed to unmount %d filesystem(s) during cleanup: %s. "
            "Manual cleanup may be required: findmnt | grep %s",
            applied.size(),
            Uncolored(e.info().msg.str()),
            rootfs);
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

void RootfsMounts::mount()
{
    if (entries.empty()) return;

    printInfo("mounting %d filesystem(s) in rootfs", entries.size());

    auto cleanup = [&](std::string_view when) {
        try {
            unmountMounted();
        } catch (Error & e) {
            printError(
                "failed to unmount filesystems during cleanup after %s failure: %s",
                Uncolored(when),
                Uncolored(e.info().msg.str()));
        }
    };

    for (auto & entry : entries) {
        Path mountPoint;
        try {
            mountPoint = dryRun ? rootfsPath(rootfs, entry.target)
                                : safeCreateMountPoint(fs, rootfs, entry.target);
        } catch (Error &) {
            cleanup("mkdir");
            throw;
        }

        printInfo("mounting %s on %s", entry.source, entry.target);
        auto spec = entry.mountCommand(mountPoint, privilege);
        ExecutionResult result;
        try {
            result = executor.execute(spec);
        } catch (Error &) {
            cleanup("mount");
            throw;
        }
        if (!result.success()) {
            cleanup("mount");
            throw ExecutionError(spec.show(), result.showStatus());
        }

        applied.push_back({.entry = &entry, .mountPoint = std::move(mountPoint)});
    }
}

void RootfsMounts::unmount()
{
    if (tornDown) return;
    unmountMounted();
    tornDown = true;
}

void RootfsMounts::unmountMounted()
{
    if (applied.empty()) return;

    printInfo("unmounting %d filesystem(s) from rootfs", applied.size());

    Strings errors;
    std::vector<Applied> stillMounted;

    for (auto i = applied.rbegin(); i != applied.rend(); ++i) {
        printInfo("unmounting %s", i->entry->target);
        auto spec = i->entry->umountCommand(i->mountPoint, privilege);
        try {
            auto result = executor.execute(spec);
            if (result.success()) continue;
            errors.push_back(fmt("umount %s failed: %s", i->entry->target, result.showStatus()));
        } catch (Error & e) {
            errors.push_back(fmt("umount %s failed: %s", i->entry->target, e.info().msg.str()));
        }
        stillMounted.insert(stillMounted.begin(), *i);
    }

    applied = std::move(stillMounted);

    if (!errors.empty())
        throw IsolationError(
            "failed to unmount %d filesystem(s): %s",
            errors.size(),
            Uncolored(concatStringsSep("; ", errors)));
}

}

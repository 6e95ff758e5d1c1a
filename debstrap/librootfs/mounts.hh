#pragma once
///@file Mount declarations and the mount lifecycle of a rootfs.

#include "debstrap/librootfs/command.hh"
#include "debstrap/librootfs/safe-fs.hh"
#include "debstrap/libutil/json-fwd.hh"
#include "debstrap/libutil/types.hh"

#include <vector>

namespace debstrap {

/**
 * One filesystem to mount inside the rootfs.
 */
struct MountEntry
{
    /**
     * Filesystem type for pseudo-filesystems, otherwise a host path or
     * device.
     */
    std::string source;

    /**
     * Absolute path inside the rootfs.
     */
    Path target;

    Strings options;

    bool operator==(const MountEntry &) const = default;

    /**
     * `source` names a kernel pseudo-filesystem (proc, sysfs, devpts,
     * tmpfs, ...).
     */
    bool isPseudoFilesystem() const;

    /**
     * `options` contain `bind` or `rbind`.
     */
    bool isBindMount() const;

    /**
     * Throws `ValidationError` if the target is not absolute, contains
     * `..`, or the source is empty or missing on the host.
     */
    void validate() const;

    /**
     * The `mount` invocation for this entry, mounting on `absTarget`.
     */
    CommandSpec mountCommand(const Path & absTarget, std::optional<PrivilegeMethod> privilege) const;

    CommandSpec umountCommand(const Path & absTarget, std::optional<PrivilegeMethod> privilege) const;

    static MountEntry parse(const JSON & json);

    JSON toJSON() const;
};

enum class MountPreset {
    /**
     * proc, sysfs, devtmpfs, devpts, and tmpfs on /tmp and /run.
     */
    Recommends,
};

std::string_view showMountPreset(MountPreset preset);

MountPreset parseMountPreset(std::string_view s);

std::vector<MountEntry> presetEntries(MountPreset preset);

/**
 * Throws `ValidationError` if some target is declared before a target
 * that is one of its ancestors.
 */
void validateMountOrder(const std::vector<MountEntry> & entries);

/**
 * Mounts a list of entries into a rootfs, in order, and unmounts them in
 * reverse order. Mount points are created with `safeCreateMountPoint()`.
 *
 * Whatever is still mounted when the object is destroyed is unmounted
 * on a best-effort basis.
 */
class RootfsMounts
{
    Path rootfs;
    std::vector<MountEntry> entries;
    CommandExecutor & executor;
    FileSystem & fs;
    std::optional<PrivilegeMethod> privilege;
    bool dryRun;

    struct Applied
    {
        const MountEntry * entry;
        /**
         * Mount point as verified by `safeCreateMountPoint()`.
         */
        Path mountPoint;
    };

    /**
     * Entries that are currently mounted, in mount order.
     */
    std::vector<Applied> applied;
    bool tornDown = false;

    void unmountMounted();

public:
    RootfsMounts(
        Path rootfs,
        std::vector<MountEntry> entries,
        CommandExecutor & executor,
        FileSystem & fs,
        std::optional<PrivilegeMethod> privilege,
        bool dryRun);

    RootfsMounts(const RootfsMounts &) = delete;
    RootfsMounts & operator=(const RootfsMounts &) = delete;

    ~RootfsMounts();

    bool empty() const
    {
        return entries.empty();
    }

    size_t mounted() const
    {
        return applied.size();
    }

    /**
     * Mount every entry. If one fails, whatever was mounted so far is
     * unmounted again before the error propagates.
     */
    void mount();

    /**
     * Unmount in reverse order. Does nothing once an unmount has
     * succeeded. After a partial failure, a later call retries only the
     * entries that are still mounted. Throws `IsolationError` listing
     * every failed entry.
     */
    void unmount();
};

}

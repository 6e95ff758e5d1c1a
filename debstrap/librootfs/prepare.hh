#pragma once
///@file Declarations of the prepare phase. They are not run as tasks;
/// the pipeline turns them into brackets around the provision phase.

#include "debstrap/librootfs/mounts.hh"
#include "debstrap/librootfs/resolv-conf.hh"

#include <variant>

namespace debstrap {

/**
 * Filesystems to mount while the provision phase runs.
 */
struct MountTask
{
    std::optional<MountPreset> preset;
    std::vector<MountEntry> mounts;

    bool operator==(const MountTask &) const = default;

    /**
     * "preset", "custom", "preset+custom" or "empty".
     */
    std::string_view name() const;

    bool hasMounts() const
    {
        return preset || !mounts.empty();
    }

    /**
     * The preset entries with custom entries for the same target
     * replacing them in place, followed by the remaining custom
     * entries in declaration order.
     */
    std::vector<MountEntry> resolvedMounts() const;

    void validate() const;

    static MountTask parse(const JSON & json);

    JSON toJSON() const;
};

/**
 * Temporary DNS configuration while the provision phase runs.
 */
struct ResolvConfTask
{
    ResolvConfConfig config;

    bool operator==(const ResolvConfTask &) const = default;

    std::string_view name() const
    {
        return config.copy ? "copy" : "generate";
    }

    void validate() const
    {
        config.validate();
    }

    static ResolvConfTask parse(const JSON & json);

    JSON toJSON() const;
};

struct PrepareTask
{
    using Raw = std::variant<MountTask, ResolvConfTask>;

    Raw raw;

    bool operator==(const PrepareTask &) const = default;

    std::string name() const;

    /**
     * `mount` or `resolv_conf`.
     */
    std::string_view typeName() const;

    void validate() const;

    static PrepareTask parse(const JSON & json);

    JSON toJSON() const;
};

}

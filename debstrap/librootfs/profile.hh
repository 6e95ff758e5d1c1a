#pragma once
///@file Build profiles: what to bootstrap and which tasks to run on it.

#include "debstrap/librootfs/bootstrap.hh"
#include "debstrap/librootfs/pipeline.hh"

#include <map>

namespace debstrap {

struct ProfileDefaults
{
    std::optional<PrivilegeDefaults> privilege;

    /**
     * Backend for tasks that do not disable isolation.
     */
    IsolationConfig isolation;

    /**
     * mitamae binary per Debian architecture.
     */
    std::map<std::string, Path> mitamae;

    bool operator==(const ProfileDefaults &) const = default;

    static ProfileDefaults parse(const JSON & json);

    JSON toJSON() const;
};

struct Profile
{
    /**
     * Output directory the bootstrap target is relative to.
     */
    Path dir;

    ProfileDefaults defaults;
    Bootstrap bootstrap;

    std::vector<PrepareTask> prepare;
    std::vector<ProvisionTask> provision;
    std::vector<AssembleTask> assemble;

    bool operator==(const Profile &) const = default;

    Pipeline pipeline() const
    {
        return Pipeline(prepare, provision, assemble);
    }

    /**
     * Make `dir`, script and binary paths absolute against `baseDir`.
     */
    void resolvePaths(const Path & baseDir);

    /**
     * Collapse every privilege and isolation setting against the
     * defaults, and fill in mitamae binaries for `arch`. Must run once
     * before `validate()` and before anything is executed.
     */
    void resolve(const std::string & arch);

    /**
     * Check everything that can be checked without side effects.
     */
    void validate() const;

    static Profile parse(const JSON & json);

    JSON toJSON() const;
};

/**
 * Read and parse a JSON profile. Relative paths in it are taken
 * relative to the directory containing the file.
 */
Profile loadProfile(const Path & path);

}

#pragma once
///@file Provision task applying a mitamae recipe inside the rootfs.

#include "debstrap/librootfs/isolation.hh"
#include "debstrap/librootfs/privilege.hh"
#include "debstrap/librootfs/task-files.hh"

#include <map>

namespace debstrap {

/**
 * The Debian architecture name of the machine we run on, e.g. `amd64`
 * for x86_64.
 */
std::string hostDebianArch();

/**
 * Translate a `uname -m` machine name into the Debian architecture
 * name. Unknown names are returned unchanged.
 */
std::string debianArchOf(std::string_view machine);

struct MitamaeTask
{
    ScriptSource source;

    /**
     * mitamae binary on the host. When absent, filled in from
     * `defaults.mitamae.<arch>` by `resolveBinary()`.
     */
    std::optional<Path> binary;

    TaskIsolation isolation;
    Privilege privilege;

    bool operator==(const MitamaeTask &) const = default;

    std::string name() const
    {
        return source.name();
    }

    void resolvePaths(const Path & baseDir);

    /**
     * Use the binary configured for `arch` if the task names none.
     */
    void resolveBinary(const std::map<std::string, Path> & binaries, const std::string & arch);

    void validate() const;

    /**
     * Copy the binary to `/tmp/mitamae-<id>` and the recipe to
     * `/tmp/recipe-<id>.rb`, then run `mitamae local` on it.
     */
    void execute(IsolationContext & context) const;

    static MitamaeTask parse(const JSON & json);

    JSON toJSON() const;
};

}

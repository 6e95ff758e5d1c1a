#pragma once
///@file Provision task running a shell script inside the rootfs.

#include "debstrap/librootfs/isolation.hh"
#include "debstrap/librootfs/privilege.hh"
#include "debstrap/librootfs/task-files.hh"

namespace debstrap {

struct ShellTask
{
    ScriptSource source;

    /**
     * Interpreter inside the rootfs. Defaults to the `default-shell`
     * setting.
     */
    std::string shell;

    TaskIsolation isolation;
    Privilege privilege;

    bool operator==(const ShellTask &) const = default;

    std::string name() const
    {
        return source.name();
    }

    void resolvePaths(const Path & baseDir)
    {
        source.resolvePaths(baseDir);
    }

    void validate() const;

    /**
     * Copy the script to `/tmp/task-<id>.sh` in the rootfs and run it
     * with the shell. The script is removed afterwards.
     */
    void execute(IsolationContext & context) const;

    static ShellTask parse(const JSON & json);

    JSON toJSON() const;
};

}

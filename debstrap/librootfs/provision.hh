#pragma once
///@file Tasks of the provision phase.

#include "debstrap/librootfs/mitamae-task.hh"
#include "debstrap/librootfs/shell-task.hh"

#include <variant>

namespace debstrap {

struct ProvisionTask
{
    using Raw = std::variant<ShellTask, MitamaeTask>;

    Raw raw;

    bool operator==(const ProvisionTask &) const = default;

    std::string name() const;

    /**
     * `shell` or `mitamae`.
     */
    std::string_view typeName() const;

    const TaskIsolation & isolation() const;

    void validate() const;

    void execute(IsolationContext & context) const;

    void resolvePaths(const Path & baseDir);

    /**
     * Collapse the isolation and privilege settings against the
     * profile defaults.
     */
    void resolveSettings(
        const IsolationConfig & isolationDefaults,
        const std::optional<PrivilegeDefaults> & privilegeDefaults,
        const std::map<std::string, Path> & mitamaeBinaries,
        const std::string & arch);

    static ProvisionTask parse(const JSON & json);

    JSON toJSON() const;
};

}

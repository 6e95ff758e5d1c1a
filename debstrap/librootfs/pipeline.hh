#pragma once
///@file The three-phase task pipeline run against a bootstrapped rootfs.

#include "debstrap/librootfs/assemble.hh"
#include "debstrap/librootfs/prepare.hh"
#include "debstrap/librootfs/provision.hh"

#include <functional>
#include <memory>
#include <vector>

namespace debstrap {

/**
 * Host resources the pipeline needs besides the task lists.
 */
struct PipelineEnvironment
{
    CommandExecutor & executor;
    FileSystem & fs;

    /**
     * Privilege for `mount` and `umount`.
     */
    std::optional<PrivilegeMethod> mountPrivilege;

    /**
     * Copied into the rootfs by `resolv_conf` with `copy: true`.
     */
    Path hostResolvConf;

    bool dryRun;

    /**
     * Picks the provider for a provision task's resolved isolation
     * setting. Defaults to `TaskIsolation::provider()`.
     */
    std::function<std::unique_ptr<IsolationProvider>(const TaskIsolation &)> providerFor;
};

/**
 * Runs prepare, provision and assemble in that order.
 *
 * The prepare declarations become two brackets around the provision
 * phase: filesystems are mounted first, then the temporary resolv.conf
 * is installed; they are released in the opposite order, also when a
 * task fails. Each provision task gets a fresh isolation context that
 * is torn down after it ran. Assemble tasks always run directly on the
 * host.
 */
class Pipeline
{
    const std::vector<PrepareTask> & prepare;
    const std::vector<ProvisionTask> & provision;
    const std::vector<AssembleTask> & assemble;

public:
    Pipeline(
        const std::vector<PrepareTask> & prepare,
        const std::vector<ProvisionTask> & provision,
        const std::vector<AssembleTask> & assemble)
        : prepare(prepare)
        , provision(provision)
        , assemble(assemble)
    {
    }

    bool empty() const;

    size_t totalTasks() const;

    const MountTask * mountTask() const;

    const ResolvConfTask * resolvConfTask() const;

    /**
     * Check phase constraints and validate every task. Errors are
     * prefixed with `<phase> <index> validation failed: `. Nothing on
     * the host is modified.
     */
    void validate() const;

    /**
     * Stops at the first failing task. Teardown failures are logged and
     * attached as traces to the error being propagated; the task error
     * comes first, then resolv.conf restoration, then unmounting.
     */
    void run(const Path & rootfs, PipelineEnvironment & env) const;
};

}

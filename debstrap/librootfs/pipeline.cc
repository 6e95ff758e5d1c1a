#include "debstrap/librootfs/pipeline.hh"
#include "debstrap/librootfs/errors.hh"
#include "debstrap/libutil/logging.hh"

namespace debstrap {

static constexpr std::string_view phasePrepare = "prepare";
static constexpr std::string_view phaseProvision = "provision";
static constexpr std::string_view phaseAssemble = "assemble";

bool Pipeline::empty() const
{
    return prepare.empty() && provision.empty() && assemble.empty();
}

size_t Pipeline::totalTasks() const
{
    return prepare.size() + provision.size() + assemble.size();
}

const MountTask * Pipeline::mountTask() const
{
    for (auto & task : prepare)
        if (auto m = std::get_if<MountTask>(&task.raw))
            return m;
    return nullptr;
}

const ResolvConfTask * Pipeline::resolvConfTask() const
{
    for (auto & task : prepare)
        if (auto r = std::get_if<ResolvConfTask>(&task.raw))
            return r;
    return nullptr;
}

static void validatePrepareConstraints(const std::vector<PrepareTask> & tasks)
{
    size_t mounts = 0, resolvConfs = 0;
    for (auto & task : tasks) {
        if (std::holds_alternative<MountTask>(task.raw)) {
            if (resolvConfs > 0)
                throw ValidationError("prepare phase: mount task must come before resolv_conf task");
            if (++mounts > 1)
                throw ValidationError("prepare phase: at most one mount task is allowed");
        } else if (std::holds_alternative<ResolvConfTask>(task.raw)) {
            if (++resolvConfs > 1)
                throw ValidationError("prepare phase: at most one resolv_conf task is allowed");
        }
    }
}

static void validateAssembleConstraints(const std::vector<AssembleTask> & tasks)
{
    size_t resolvConfs = 0;
    for (auto & task : tasks)
        if (std::holds_alternative<AssembleResolvConfTask>(task.raw) && ++resolvConfs > 1)
            throw ValidationError("assemble phase: at most one resolv_conf task is allowed");
}

template<typename Task>
static void validatePhase(std::string_view phase, const std::vector<Task> & tasks)
{
    size_t index = 0;
    for (auto & task : tasks) {
        ++index;
        try {
            task.validate();
        } catch (IoError & e) {
            e.prefixContext(fmt("%s %d validation failed: ", phase, index));
            throw;
        } catch (Error & e) {
            throw ValidationError(
                "%s", Uncolored(fmt("%s %d validation failed: %s", phase, index, e.info().msg.str())));
        }
    }
}

void Pipeline::validate() const
{
    validatePrepareConstraints(prepare);
    validateAssembleConstraints(assemble);

    validatePhase(phasePrepare, prepare);
    validatePhase(phaseProvision, provision);
    validatePhase(phaseAssemble, assemble);
}

/**
 * Run one task in a fresh context from `provider`, always tearing the
 * context down again.
 */
template<typename Task>
static void runTask(const Task & task, const IsolationProvider & provider, const Path & rootfs, PipelineEnvironment & env)
{
    std::unique_ptr<IsolationContext> context;
    try {
        context = provider.setup(rootfs, env.executor, env.dryRun);
    } catch (Error & e) {
        e.addTrace("failed to setup isolation context");
        throw;
    }

    try {
        task.execute(*context);
    } catch (Error & e) {
        try {
            context->teardown();
        } catch (Error & teardownError) {
            e.addTrace("additionally, teardown failed: %s", Uncolored(teardownError.info().msg.str()));
        }
        throw;
    }

    try {
        context->teardown();
    } catch (Error & e) {
        e.addTrace("failed to teardown isolation context");
        throw;
    }
}

template<typename Task, typename GetProvider>
static void runPhase(
    std::string_view phase,
    const std::vector<Task> & tasks,
    GetProvider && getProvider,
    const Path & rootfs,
    PipelineEnvironment & env)
{
    if (tasks.empty()) {
        debug("skipping empty %s phase", phase);
        return;
    }

    printInfo("running %s phase (%d task(s))", phase, tasks.size());

    size_t index = 0;
    for (auto & task : tasks) {
        ++index;
        printInfo("running %s %d/%d: %s", phase, index, tasks.size(), task.name());
        try {
            auto provider = getProvider(task);
            runTask(task, *provider, rootfs, env);
        } catch (Error & e) {
            e.addTrace("failed to run %s %d", phase, index);
            throw;
        }
    }
}

static void unmountAfterFailure(RootfsMounts & mounts, Error & primary)
{
    try {
        mounts.unmount();
    } catch (Error & e) {
        printError("failed to unmount filesystems after an earlier failure: %s", Uncolored(e.info().msg.str()));
        primary.addTrace("additionally, unmounting failed: %s", Uncolored(e.info().msg.str()));
    }
}

/**
 * Release both brackets. With `primary` set, failures are attached to
 * it; otherwise the first failure is thrown with any later one attached.
 */
static void closeBrackets(RootfsResolvConf & resolvConf, RootfsMounts & mounts, Error * primary)
{
    try {
        resolvConf.teardown();
    } catch (Error & e) {
        if (!primary) {
            e.addTrace("failed to restore resolv.conf after the provision phase completed successfully");
            unmountAfterFailure(mounts, e);
            throw;
        }
        printError("failed to restore resolv.conf after an earlier failure: %s", Uncolored(e.info().msg.str()));
        primary->addTrace("additionally, restoring resolv.conf failed: %s", Uncolored(e.info().msg.str()));
    }

    if (primary) {
        unmountAfterFailure(mounts, *primary);
        return;
    }

    try {
        mounts.unmount();
    } catch (Error & e) {
        e.addTrace("failed to unmount filesystems after the provision phase completed successfully");
        throw;
    }
}

void Pipeline::run(const Path & rootfs, PipelineEnvironment & env) const
{
    if (empty()) return;

    printInfo("starting pipeline with %d task(s)", totalTasks());

    if (!prepare.empty()) {
        printInfo("running %s phase (%d task(s))", phasePrepare, prepare.size());
        for (auto & task : prepare)
            debug("%s declares %s (%s)", phasePrepare, task.typeName(), task.name());
    }

    auto mount = mountTask();
    auto resolv = resolvConfTask();

    RootfsMounts mounts(
        rootfs,
        mount ? mount->resolvedMounts() : std::vector<MountEntry>{},
        env.executor,
        env.fs,
        env.mountPrivilege,
        env.dryRun);
    RootfsResolvConf resolvConf(
        rootfs,
        resolv ? std::optional{resolv->config} : std::nullopt,
        env.hostResolvConf,
        env.fs,
        env.dryRun);

    mounts.mount();

    try {
        resolvConf.setup();
    } catch (Error & e) {
        unmountAfterFailure(mounts, e);
        throw;
    }

    try {
        runPhase(phaseProvision, provision, [&](const ProvisionTask & task) {
            return env.providerFor ? env.providerFor(task.isolation()) : task.isolation().provider();
        }, rootfs, env);
    } catch (Error & e) {
        closeBrackets(resolvConf, mounts, &e);
        throw;
    }

    closeBrackets(resolvConf, mounts, nullptr);

    runPhase(phaseAssemble, assemble, [](const AssembleTask &) -> std::unique_ptr<IsolationProvider> {
        return std::make_unique<DirectProvider>();
    }, rootfs, env);

    printInfo("pipeline completed successfully");
}

}

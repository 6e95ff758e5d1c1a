#include "debstrap/librootfs/build.hh"
#include "debstrap/librootfs/errors.hh"
#include "debstrap/librootfs/globals.hh"
#include "debstrap/librootfs/mitamae-task.hh"
#include "debstrap/libutil/file-system.hh"
#include "debstrap/libutil/json.hh"
#include "debstrap/libutil/logging.hh"

namespace debstrap {

Profile loadResolvedProfile(const Path & file)
{
    Profile profile = [&]() {
        try {
            return loadProfile(file);
        } catch (Error & e) {
            e.addTrace("failed to load profile from %s", file);
            throw;
        }
    }();

    try {
        profile.resolve(hostDebianArch());
        profile.validate();
    } catch (Error & e) {
        e.addTrace("profile validation failed");
        throw;
    }

    return profile;
}

void runBootstrapPhase(const Profile & profile, CommandExecutor & executor)
{
    auto spec = profile.bootstrap.command(profile.dir);

    printInfo("running %s", spec.command);

    ExecutionResult result;
    try {
        result = executor.execute(spec);
    } catch (Error & e) {
        e.addTrace("failed to execute %s", spec.command);
        throw;
    }

    if (!result.success())
        throw ExecutionError(spec.show(), result.showStatus());
}

void runPipelinePhase(const Profile & profile, CommandExecutor & executor, FileSystem & fs, bool dryRun)
{
    auto pipeline = profile.pipeline();
    if (pipeline.empty()) return;

    auto output = profile.bootstrap.rootfsOutput(profile.dir);
    auto rootfs = output.directory();
    if (!rootfs)
        throw ValidationError(
            "pipeline tasks require directory output but bootstrap is configured for non-directory format. "
            "Please set bootstrap format to 'directory' or remove pipeline tasks.");

    PipelineEnvironment env{
        .executor = executor,
        .fs = fs,
        .mountPrivilege = profile.defaults.privilege
            ? std::optional{profile.defaults.privilege->method}
            : std::nullopt,
        .hostResolvConf = settings.hostResolvConf.get(),
        .dryRun = dryRun,
    };

    pipeline.run(*rootfs, env);
}

void runPipelinePhase(const Profile & profile, CommandExecutor & executor, bool dryRun)
{
    LocalFileSystem fs;
    runPipelinePhase(profile, executor, fs, dryRun);
}

void runApply(const ApplyOptions & options, CommandExecutor & executor)
{
    if (options.dryRun)
        printTaggedWarning("DRY-RUN MODE: No changes will be made");

    auto profile = loadResolvedProfile(options.file);

    if (!options.dryRun && !pathExists(profile.dir)) {
        try {
            createDirs(profile.dir);
        } catch (SysError & e) {
            throw IoError(fmt("failed to create directory: %s", profile.dir), e.errNo);
        }
    }

    runBootstrapPhase(profile, executor);

    runPipelinePhase(profile, executor, options.dryRun);
}

Profile runValidate(const ValidateOptions & options)
{
    auto profile = loadResolvedProfile(options.file);
    printInfo("validation successful:\n%s", profile.toJSON().dump(2));
    return profile;
}

}

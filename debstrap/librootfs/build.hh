#pragma once
///@file Entry points behind `debstrap apply` and `debstrap validate`.

#include "debstrap/librootfs/profile.hh"

namespace debstrap {

struct ApplyOptions
{
    Path file = "profile.json";
    bool dryRun = false;
};

struct ValidateOptions
{
    Path file = "profile.json";
};

/**
 * Load, resolve and validate the profile at `file`.
 */
Profile loadResolvedProfile(const Path & file);

/**
 * Run the bootstrap tool of `profile` through `executor`.
 */
void runBootstrapPhase(const Profile & profile, CommandExecutor & executor);

/**
 * Run the task pipeline of `profile` against its bootstrapped rootfs.
 */
void runPipelinePhase(const Profile & profile, CommandExecutor & executor, FileSystem & fs, bool dryRun);

/**
 * As above, traversing the real filesystem.
 */
void runPipelinePhase(const Profile & profile, CommandExecutor & executor, bool dryRun);

/**
 * Bootstrap the rootfs and run the pipeline on it.
 */
void runApply(const ApplyOptions & options, CommandExecutor & executor);

/**
 * Load and validate the profile without touching anything. Returns the
 * resolved profile.
 */
Profile runValidate(const ValidateOptions & options);

}

#include "commands.hh"
#include "debstrap/librootfs/build.hh"
#include "debstrap/librootfs/command.hh"

namespace debstrap {

struct CmdApply : Command
{
    ApplyOptions options;

    CmdApply()
    {
        addFlag({
            .longName = "file",
            .shortName = 'f',
            .description = "Profile to apply.",
            .labels = {"path"},
            .handler = {&options.file},
        });

        addFlag({
            .longName = "dry-run",
            .description = "Show the commands that would run without running them.",
            .handler = {&options.dryRun, true},
        });
    }

    std::string description() override
    {
        return "bootstrap a rootfs and run the task pipeline of a profile";
    }

    void run() override
    {
        RealCommandExecutor executor(options.dryRun);
        runApply(options, executor);
    }
};

std::unique_ptr<Command> makeCmdApply()
{
    return std::make_unique<CmdApply>();
}

}

#include "commands.hh"
#include "debstrap/librootfs/build.hh"

namespace debstrap {

struct CmdValidate : Command
{
    ValidateOptions options;

    CmdValidate()
    {
        addFlag({
            .longName = "file",
            .shortName = 'f',
            .description = "Profile to validate.",
            .labels = {"path"},
            .handler = {&options.file},
        });
    }

    std::string description() override
    {
        return "check a profile without running anything";
    }

    void run() override
    {
        runValidate(options);
    }
};

std::unique_ptr<Command> makeCmdValidate()
{
    return std::make_unique<CmdValidate>();
}

}

#include "commands.hh"
#include "debstrap/libmain/common-args.hh"
#include "debstrap/libmain/shared.hh"
#include "debstrap/libutil/args.hh"
#include "debstrap/libutil/error.hh"
#include "debstrap/libutil/file-system.hh"
#include "debstrap/libutil/logging.hh"

#include <iostream>

namespace debstrap {

struct DebstrapArgs : virtual MultiCommand, virtual MixCommonArgs, virtual RootArgs
{
    bool helpRequested = false;
    bool showVersion = false;

    DebstrapArgs(const std::string & programName)
        : MultiCommand({
            {"apply", makeCmdApply},
            {"validate", makeCmdValidate},
        })
        , MixCommonArgs(programName)
    {
        addFlag({
            .longName = "help",
            .description = "Show usage information.",
            .handler = {[this]() { this->helpRequested = true; }},
        });

        addFlag({
            .longName = "version",
            .description = "Show version information.",
            .handler = {[&]() { showVersion = true; }},
        });
    }

    std::string description() override
    {
        return "build Debian root filesystems from a declarative profile";
    }

    void run()
    {
        command->second->run();
    }
};

static void showHelp(DebstrapArgs & args)
{
    std::string res = fmt("Usage: %s [options] <command> [options]\n\n", args.programName);
    res += args.description() + "\n\nCommands:\n";
    for (auto & [name, make] : args.commands)
        res += fmt("  %-12s%s\n", name, make()->description());
    res += "\nOptions:\n" + args.showFlags();
    if (args.command) {
        res += fmt("\nOptions of '%s':\n", args.command->first);
        res += args.command->second->showFlags();
    }
    std::cout << res;
}

void mainWrapped(int argc, char * * argv)
{
    initDebstrap();

    DebstrapArgs args(std::string(baseNameOf(argv[0])));

    try {
        args.parseCmdline({argv + 1, argv + argc});
    } catch (UsageError &) {
        if (!args.helpRequested) throw;
    }

    if (args.helpRequested) {
        showHelp(args);
        return;
    }

    if (args.showVersion)
        printVersion(args.programName);

    if (!args.command)
        throw UsageError("no subcommand specified");

    args.run();
}

}

int main(int argc, char * * argv)
{
    if (argc < 1) {
        std::cerr << "debstrap: argv[0] is missing" << std::endl;
        return 1;
    }

    return debstrap::handleExceptions(argv[0], [&]() {
        debstrap::mainWrapped(argc, argv);
    });
}

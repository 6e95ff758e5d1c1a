#include "debstrap/librootfs/command.hh"
#include "debstrap/librootfs/errors.hh"
#include "debstrap/libutil/logging.hh"
#include "debstrap/libutil/processes.hh"
#include "debstrap/libutil/strings.hh"

#include <sys/wait.h>

namespace debstrap {

std::string CommandSpec::show() const
{
    if (args.empty()) return command;
    return command + " " + concatMapStringsSep(" ", args, debugQuote);
}

bool ExecutionResult::success() const
{
    return !status || statusOk(*status);
}

std::optional<int> ExecutionResult::code() const
{
    if (status && WIFEXITED(*status))
        return WEXITSTATUS(*status);
    return std::nullopt;
}

std::string ExecutionResult::showStatus() const
{
    if (!status) return "unknown (no status available)";
    return statusToString(*status);
}

static Path findCommand(const std::string & name, std::string_view label)
{
    auto path = findExecutable(name);
    if (!path) {
        debug("command lookup failed for '%s'", name);
        throw CommandNotFoundError(name, label);
    }
    return *path;
}

ExecutionResult RealCommandExecutor::execute(const CommandSpec & spec)
{
    if (dryRun) {
        std::string prefix;
        if (spec.privilege)
            prefix = std::string(showPrivilegeMethod(*spec.privilege)) + " ";
        printInfo("dry run: %s%s", prefix, spec.show());
        if (spec.cwd)
            printInfo("dry run cwd: %s", *spec.cwd);
        return ExecutionResult{.status = std::nullopt};
    }

    RunOptions options{.searchPath = false};

    if (spec.privilege) {
        auto privilegeCommand =
            findCommand(std::string(showPrivilegeMethod(*spec.privilege)), "privilege escalation command");
        auto actualCommand = findCommand(spec.command, "command");
        vomit("privilege escalation: %s %s", showPrivilegeMethod(*spec.privilege), actualCommand);
        options.program = privilegeCommand;
        options.args.push_back(actualCommand);
        options.args.insert(options.args.end(), spec.args.begin(), spec.args.end());
    } else {
        options.program = findCommand(spec.command, "command");
        vomit("command found: %s: %s", spec.command, options.program);
        options.args = spec.args;
    }

    options.chdir = spec.cwd;
    for (auto & [key, value] : spec.env)
        options.extraEnvironment[key] = value;

    int status;
    try {
        status = runProgram(
            options,
            [](std::string_view line) { printInfo("%s", Uncolored(line)); },
            [](std::string_view line) { printWarning("%s", Uncolored(line)); }
        );
    } catch (SysError & e) {
        throw ExecutionError(spec.show(), e.info().msg.str());
    }

    vomit("executed command: %s: success=%s", spec.command, statusOk(status));

    return ExecutionResult{.status = status};
}

}

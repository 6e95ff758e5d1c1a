#pragma once
///@file Process execution capability used for every external command.

#include "debstrap/librootfs/privilege.hh"
#include "debstrap/libutil/types.hh"

#include <optional>
#include <utility>
#include <vector>

namespace debstrap {

/**
 * A command to run, optionally wrapped in privilege escalation.
 */
struct CommandSpec
{
    std::string command;
    Strings args;
    std::optional<Path> cwd = std::nullopt;
    /**
     * Variables set in addition to the inherited environment.
     */
    std::vector<std::pair<std::string, std::string>> env = {};
    std::optional<PrivilegeMethod> privilege = std::nullopt;

    /**
     * `command "arg1" "arg2"`, as used in logs and error messages.
     */
    std::string show() const;
};

struct ExecutionResult
{
    /**
     * Wait status of the process. Absent in dry-run mode.
     */
    std::optional<int> status;

    /**
     * True on exit code 0, and in dry-run mode.
     */
    bool success() const;

    std::optional<int> code() const;

    /**
     * Describes the status for error messages.
     */
    std::string showStatus() const;
};

class CommandExecutor
{
public:
    virtual ~CommandExecutor() = default;

    /**
     * Run the command to completion. Throws when the command cannot be
     * started at all; a non-zero exit is reported in the result.
     */
    virtual ExecutionResult execute(const CommandSpec & spec) = 0;
};

/**
 * Runs commands on the host, streaming their stdout to the info log
 * and their stderr to the warning log. In dry-run mode the would-be
 * invocation is logged and nothing is started.
 */
class RealCommandExecutor : public CommandExecutor
{
    bool dryRun;

public:
    explicit RealCommandExecutor(bool dryRun) : dryRun(dryRun) {}

    ExecutionResult execute(const CommandSpec & spec) override;
};

}

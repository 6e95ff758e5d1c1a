#pragma once
///@file

#include "debstrap/libutil/types.hh"

#include <functional>
#include <map>
#include <optional>

namespace debstrap {

/**
 * Search `PATH` for an executable named `name`. Names containing a
 * slash are checked as given.
 */
std::optional<Path> findExecutable(std::string_view name);

struct RunOptions
{
    Path program;
    /** Resolve `program` through `PATH` (execvp) rather than as given. */
    bool searchPath = true;
    Strings args = {};
    std::optional<Path> chdir = {};
    /** Set on top of the inherited environment. */
    std::map<std::string, std::string> extraEnvironment = {};
};

/**
 * Receives one line of child output, without the trailing newline.
 */
using LineSink = std::function<void(std::string_view line)>;

/**
 * Run a program to completion, handing each line it writes to stdout
 * and stderr to the matching sink as it arrives. The child is killed
 * if debstrap dies. Returns the wait status.
 */
int runProgram(const RunOptions & options, const LineSink & onStdout, const LineSink & onStderr);

/**
 * Describe a wait status for an error message.
 */
std::string statusToString(int status);

bool statusOk(int status);

}

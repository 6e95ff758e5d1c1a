#pragma once
///@file Error taxonomy shared by every rootfs operation.

#include "debstrap/libutil/error.hh"

namespace debstrap {

/**
 * A static invariant of the profile does not hold. Always raised before
 * any side effect.
 */
MakeError(ValidationError, Error);

/**
 * An unsafe condition was detected while setting up, tearing down or
 * traversing the rootfs (a symlink where a directory was required, a
 * stale backup file, an isolation backend misuse).
 */
MakeError(IsolationError, Error);

/**
 * A setting was used before it was resolved, or a configuration file
 * could not be loaded.
 */
MakeError(ConfigError, Error);

/**
 * A spawned command did not succeed.
 */
class ExecutionError : public Error
{
public:
    std::string command;
    std::string status;

    ExecutionError(std::string command, std::string status);
};

/**
 * A referenced program could not be found on the host.
 */
class CommandNotFoundError : public Error
{
public:
    std::string command;

    /**
     * @param label What the command is used as, e.g. "command" or
     * "privilege escalation command".
     */
    CommandNotFoundError(std::string command, std::string_view label = "command");
};

/**
 * A filesystem operation failed. The message reads
 * `<context>: I/O error: <classification>`.
 */
class IoError : public Error
{
public:
    std::string context;
    int errNo;

    IoError(std::string context, int errNo);

    /**
     * Prefix the context, keeping the errno classification intact.
     */
    void prefixContext(std::string_view prefix);
};

/**
 * Human-readable classification of an errno value: "not found",
 * "permission denied", "is a directory", or the `strerror()` text.
 */
std::string ioErrorKindMessage(int errNo);

}

#include "debstrap/librootfs/errors.hh"
#include "debstrap/libutil/strings.hh"

#include <cerrno>

namespace debstrap {

ExecutionError::ExecutionError(std::string command_, std::string status_)
    : Error("command execution failed: %s: %s", Uncolored(command_), status_)
    , command(std::move(command_))
    , status(std::move(status_))
{
}

CommandNotFoundError::CommandNotFoundError(std::string command_, std::string_view label)
    : Error("%s not found: %s", Uncolored(label), command_)
    , command(std::move(command_))
{
}

std::string ioErrorKindMessage(int errNo)
{
    switch (errNo) {
    case ENOENT:
        return "I/O error: not found";
    case EACCES:
    case EPERM:
        return "I/O error: permission denied";
    case EISDIR:
        return "I/O error: is a directory";
    default:
        return "I/O error: " + toLower(strerror(errNo));
    }
}

IoError::IoError(std::string context_, int errNo_)
    : Error("%s: %s", Uncolored(context_), Uncolored(ioErrorKindMessage(errNo_)))
    , context(std::move(context_))
    , errNo(errNo_)
{
}

void IoError::prefixContext(std::string_view prefix)
{
    context = std::string(prefix) + context;
    err.msg = HintFmt("%s: %s", Uncolored(context), Uncolored(ioErrorKindMessage(errNo)));
    what_.reset();
}

}

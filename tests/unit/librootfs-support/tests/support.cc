#include "tests/event-log.hh"
#include "tests/recording-executor.hh"
#include "tests/temp-rootfs.hh"

#include "debstrap/libutil/error.hh"
#include "debstrap/libutil/terminal.hh"

#include <sys/wait.h>

namespace debstrap {

ExecutionResult RecordingExecutor::execute(const CommandSpec & spec)
{
    calls.push_back(spec);
    if (events) events->record("exec: " + commandLine(spec));
    if (handler) return handler(spec);
    return ExecutionResult{.status = exitStatus(0)};
}

std::vector<std::string> RecordingExecutor::shown() const
{
    std::vector<std::string> res;
    for (auto & spec : calls)
        res.push_back(commandLine(spec));
    return res;
}

std::string commandLine(const CommandSpec & spec)
{
    auto res = spec.command;
    for (auto & arg : spec.args)
        res += " " + arg;
    return res;
}

int exitStatus(int code)
{
    return W_EXITCODE(code, 0);
}

EventLog::EventLog(Verbosity level)
    : prevLogger(logger)
    , prevVerbosity(verbosity)
{
    logger = this;
    verbosity = level;
}

EventLog::~EventLog()
{
    logger = prevLogger;
    verbosity = prevVerbosity;
}

void EventLog::log(Verbosity lvl, std::string_view s)
{
    events.push_back(filterANSIEscapes(s, true));
}

void EventLog::logEI(const ErrorInfo & ei)
{
    events.push_back(filterANSIEscapes(ei.msg.str(), true));
}

long EventLog::indexOf(std::string_view needle) const
{
    for (size_t i = 0; i < events.size(); ++i)
        if (events[i].find(needle) != std::string::npos)
            return long(i);
    return -1;
}

void TempRootfsTest::SetUp()
{
    tmpDir = createTempDir();
    cleanup.reset(tmpDir);
    rootfs = tmpDir + "/rootfs";
    createDirs(rootfs + "/tmp");
    createDirs(rootfs + "/etc");
    createDirs(rootfs + "/bin");
    writeFile(rootfs + "/bin/sh", "#!/bin/sh\n", 0755);
}

Path TempRootfsTest::writeHostFile(const Path & relPath, std::string_view contents, mode_t mode)
{
    auto path = tmpDir + "/" + relPath;
    createDirs(dirOf(path));
    writeFile(path, contents, mode);
    return path;
}

}

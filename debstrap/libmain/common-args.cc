#include "debstrap/libmain/common-args.hh"
#include "debstrap/libmain/loggers.hh"
#include "debstrap/libutil/config.hh"
#include "debstrap/libutil/error.hh"
#include "debstrap/libutil/logging.hh"

namespace debstrap {

MixCommonArgs::MixCommonArgs(const std::string & programName)
    : programName(programName)
{
    addFlag({
        .longName = "verbose",
        .shortName = 'v',
        .description = "Increase the logging verbosity level.",
        .handler = {[]() { verbosity = verbosityFromIntClamped(int(verbosity) + 1); }},
    });

    addFlag({
        .longName = "quiet",
        .description = "Decrease the logging verbosity level.",
        .handler = {[]() { verbosity = verbosityFromIntClamped(int(verbosity) - 1); }},
    });

    addFlag({
        .longName = "debug",
        .description = "Set the logging verbosity level to 'debug'.",
        .handler = {[]() { verbosity = lvlDebug; }},
    });

    addFlag({
        .longName = "option",
        .description = "Set the debstrap configuration setting *name* to *value* (overriding `debstrap.conf`).",
        .labels = {"name", "value"},
        .handler = {[](std::string name, std::string value) {
            if (!globalConfig.set(name, value))
                throw UsageError("unknown setting '%s'", name);
        }},
    });

    addFlag({
        .longName = "log-format",
        .description = "Set the format of log output; one of `raw` or `internal-json`.",
        .labels = {"format"},
        .handler = {[](std::string format) { setLogFormat(format); }},
    });
}

}

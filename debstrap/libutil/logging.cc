#include "debstrap/libutil/environment-variables.hh"
#include "debstrap/libutil/file-descriptor.hh"
#include "debstrap/libutil/logging.hh"
#include "debstrap/libutil/json.hh"
#include "debstrap/libutil/terminal.hh"

#include <algorithm>
#include <mutex>
#include <sstream>

namespace debstrap {

Logger * logger = makeSimpleLogger();

Verbosity verbosity = lvlInfo;

Verbosity verbosityFromIntClamped(int val)
{
    return static_cast<Verbosity>(std::clamp(val, int(lvlError), int(lvlVomit)));
}

/* Severity prefixes understood by journald, see sd-daemon(3). */
static char journalPriority(Verbosity lvl)
{
    switch (lvl) {
    case lvlError: return '3';
    case lvlWarn: return '4';
    case lvlNotice:
    case lvlInfo: return '5';
    case lvlTalkative:
    case lvlChatty: return '6';
    default: return '7';
    }
}

class SimpleLogger : public Logger
{
    bool systemd = getEnv("IN_SYSTEMD") == "1";
    bool tty = shouldANSI();

public:
    void log(Verbosity lvl, std::string_view s) override
    {
        if (lvl > verbosity) return;

        std::string line;
        if (systemd) {
            line += '<';
            line += journalPriority(lvl);
            line += '>';
        }
        line += filterANSIEscapes(s, !tty);
        line += '\n';
        writeLogsToStderr(line);
    }

    void logEI(const ErrorInfo & ei) override
    {
        std::ostringstream oss;
        showErrorInfo(oss, ei);
        log(ei.level, oss.str());
    }
};

Logger * makeSimpleLogger()
{
    return new SimpleLogger();
}

class JSONLogger : public Logger
{
    Logger & prevLogger;

    void write(const JSON & json)
    {
        prevLogger.log(lvlError, "@debstrap " + json.dump(-1, ' ', false, JSON::error_handler_t::replace));
    }

public:
    JSONLogger(Logger & prevLogger) : prevLogger(prevLogger) { }

    void log(Verbosity lvl, std::string_view s) override
    {
        if (lvl > verbosity) return;

        write({
            {"action", "msg"},
            {"level", static_cast<int>(lvl)},
            {"msg", s},
        });
    }

    void logEI(const ErrorInfo & ei) override
    {
        std::ostringstream oss;
        showErrorInfo(oss, ei);

        JSON json{
            {"action", "msg"},
            {"level", static_cast<int>(ei.level)},
            {"msg", oss.str()},
            {"raw_msg", ei.msg.str()},
        };

        if (!ei.traces.empty()) {
            auto & traces = json["trace"] = JSON::array();
            for (auto & trace : ei.traces)
                traces.push_back(JSON{{"raw_msg", trace.hint.str()}});
        }

        write(json);
    }
};

Logger * makeJSONLogger(Logger & prevLogger)
{
    return new JSONLogger(prevLogger);
}

void writeLogsToStderr(std::string_view s)
{
    static std::mutex lock;

    std::unique_lock _lock(lock);
    try {
        writeFull(STDERR_FILENO, s);
    } catch (SysError &) {
        /* stderr may have been closed under us; cleanup code that logs
           must still run to completion. */
    }
}

}

#pragma once
///@file

#include "debstrap/libutil/types.hh"
#include "debstrap/libutil/error.hh"

namespace debstrap {

class Logger
{
public:
    virtual ~Logger() { }

    virtual void log(Verbosity lvl, std::string_view s) = 0;

    virtual void logEI(const ErrorInfo & ei) = 0;
};

extern Logger * logger;

/** Messages above this level are dropped. */
extern Verbosity verbosity;

/** Plain text on stderr, coloured when stderr is a terminal. */
Logger * makeSimpleLogger();

/** One `@debstrap {...}` JSON object per message, written through `prevLogger`. */
Logger * makeJSONLogger(Logger & prevLogger);

#define logError(errorInfo)                                      \
    do {                                                         \
        if (::debstrap::lvlError <= ::debstrap::verbosity)       \
            ::debstrap::logger->logEI(errorInfo);                \
    } while (0)

/**
 * Log a formatted message at `level`. A macro so that the arguments are
 * only evaluated when the message is actually shown. `fs` must be a
 * string literal.
 */
#define printMsg(level, fs, args...)                                                       \
    do {                                                                                   \
        auto _debstrap_lvl = level;                                                        \
        const char * _debstrap_fs = []<size_t N>(const char(&lit)[N]) { return lit; }(fs); \
        if (_debstrap_lvl <= ::debstrap::verbosity)                                        \
            ::debstrap::logger->log(_debstrap_lvl, ::debstrap::HintFmt(_debstrap_fs, ##args).str()); \
    } while (0)

#define printError(fs, args...) printMsg(::debstrap::lvlError, fs, ##args)
#define printWarning(fs, args...) printMsg(::debstrap::lvlWarn, fs, ##args)
#define printInfo(fs, args...) printMsg(::debstrap::lvlInfo, fs, ##args)
#define debug(fs, args...) printMsg(::debstrap::lvlDebug, fs, ##args)
#define vomit(fs, args...) printMsg(::debstrap::lvlVomit, fs, ##args)

#define printTaggedWarning(fs, args...) \
    printWarning(ANSI_WARNING "warning:" ANSI_NORMAL " " fs, ##args)

void writeLogsToStderr(std::string_view s);

}

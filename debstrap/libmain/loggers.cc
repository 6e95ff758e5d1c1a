#include "debstrap/libmain/loggers.hh"
#include "debstrap/libutil/error.hh"
#include "debstrap/libutil/logging.hh"

namespace debstrap {

void setLogFormat(const std::string & logFormatStr)
{
    if (logFormatStr == "raw")
        setLogFormat(LogFormat::Raw);
    else if (logFormatStr == "internal-json")
        setLogFormat(LogFormat::InternalJson);
    else
        throw UsageError("setting 'log-format' has an invalid value '%s'", logFormatStr);
}

void setLogFormat(LogFormat logFormat)
{
    switch (logFormat) {
    case LogFormat::Raw:
        logger = makeSimpleLogger();
        break;
    case LogFormat::InternalJson:
        logger = makeJSONLogger(*makeSimpleLogger());
        break;
    }
}

}

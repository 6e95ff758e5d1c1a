#pragma once
///@file

#include <string>

namespace debstrap {

enum class LogFormat {
    /** Human-readable lines on stderr. */
    Raw,
    /** One `@debstrap {...}` JSON object per line on stderr. */
    InternalJson,
};

/**
 * Parse a `--log-format` value (`raw` or `internal-json`) and install
 * the matching logger. Throws `UsageError` for anything else.
 */
void setLogFormat(const std::string & logFormatStr);

void setLogFormat(LogFormat logFormat);

}

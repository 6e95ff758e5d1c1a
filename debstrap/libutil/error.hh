#pragma once
/**
 * @file
 *
 * @brief Error reporting for debstrap.
 *
 * Every exception debstrap throws on purpose derives from `Error` and
 * carries an `ErrorInfo`: a message plus a list of traces describing
 * what was going on when it happened. Turning that into text is left
 * to the logger.
 */

#include "debstrap/libutil/fmt.hh"

#include <cerrno>
#include <cstring>
#include <exception>
#include <list>
#include <optional>
#include <system_error>

namespace debstrap {

typedef enum {
    lvlError = 0,
    lvlWarn,
    lvlNotice,
    lvlInfo,
    lvlTalkative,
    lvlChatty,
    lvlDebug,
    lvlVomit
} Verbosity;

Verbosity verbosityFromIntClamped(int val);

struct Trace {
    HintFmt hint;
};

struct ErrorInfo {
    Verbosity level = lvlError;
    HintFmt msg;
    /** Most recently added first. */
    std::list<Trace> traces = {};
};

std::ostream & showErrorInfo(std::ostream & out, const ErrorInfo & einfo);

class BaseError : public std::exception
{
protected:
    mutable ErrorInfo err;

    /** `err` rendered by `showErrorInfo`, computed on demand. */
    mutable std::optional<std::string> what_;
    const std::string & calcWhat() const;

public:
    template<typename... Args>
    explicit BaseError(const std::string & fs, const Args & ... args)
        : err { .level = lvlError, .msg = HintFmt(fs, args...) }
    { }

    BaseError(HintFmt hint)
        : err { .level = lvlError, .msg = hint }
    { }

    const char * what() const noexcept override { return calcWhat().c_str(); }
    const std::string & msg() const { return calcWhat(); }
    const ErrorInfo & info() const { return err; }

    /**
     * Record what was going on when the error happened. Traces are
     * printed below the message, most recent first.
     */
    template<typename... Args>
    void addTrace(std::string_view fs, const Args & ... args)
    {
        addTrace(HintFmt(std::string(fs), args...));
    }

    void addTrace(HintFmt hint);
};

#define MakeError(newClass, superClass) \
    class newClass : public superClass  \
    {                                   \
    public:                             \
        using superClass::superClass;   \
    }

MakeError(Error, BaseError);
MakeError(UsageError, Error);

/**
 * An error from a failed system call. The message gets the description
 * of `errNo` appended.
 */
class SysError : public Error
{
public:
    int errNo;

    template<typename... Args>
    SysError(int errNo, const Args & ... args)
        : Error(HintFmt("%1%: %2%", Uncolored(HintFmt(args...).str()), std::strerror(errNo)))
        , errNo(errNo)
    { }

    template<typename... Args>
    SysError(std::error_code ec, const Args & ... args)
        : Error(HintFmt("%1%: %2%", Uncolored(HintFmt(args...).str()), ec.message()))
        , errNo(ec.value())
    { }

    template<typename... Args>
    SysError(const Args & ... args)
        : SysError(errno, args ...)
    { }
};

/**
 * Log the exception in flight and carry on. For destructors, which must
 * not throw. Only call it inside a `catch` block.
 */
void ignoreExceptionInDestructor(Verbosity lvl = lvlError);

}

#include "debstrap/libutil/error.hh"
#include "debstrap/libutil/logging.hh"

#include <sstream>

namespace debstrap {

void BaseError::addTrace(HintFmt hint)
{
    err.traces.push_front(Trace { .hint = hint });
    what_.reset();
}

const std::string & BaseError::calcWhat() const
{
    if (!what_) {
        std::ostringstream oss;
        showErrorInfo(oss, err);
        what_ = oss.str();
    }
    return *what_;
}

/* Continuation lines are indented so they line up under the message. */
static std::string indent(std::string_view prefix, std::string_view s)
{
    std::string res;
    for (bool first = true; !s.empty(); first = false) {
        auto end = s.find('\n');
        if (!first) {
            res += '\n';
            res += prefix;
        }
        res += s.substr(0, end);
        if (end == s.npos) break;
        s = s.substr(end + 1);
    }
    return res;
}

static const char * levelPrefix(Verbosity level)
{
    switch (level) {
    case lvlError: return ANSI_RED "error";
    case lvlWarn: return ANSI_WARNING "warning";
    case lvlNotice: return ANSI_RED "note";
    case lvlInfo: return ANSI_GREEN "info";
    case lvlTalkative: return ANSI_GREEN "talk";
    case lvlChatty: return ANSI_GREEN "chat";
    case lvlDebug: return ANSI_WARNING "debug";
    case lvlVomit: return ANSI_GREEN "vomit";
    }
    return ANSI_RED "error";
}

std::ostream & showErrorInfo(std::ostream & out, const ErrorInfo & einfo)
{
    out << levelPrefix(einfo.level) << ":" ANSI_NORMAL " " << indent("       ", einfo.msg.str());

    for (auto & trace : einfo.traces)
        out << "\n       " ANSI_FAINT "… " ANSI_NORMAL << indent("         ", trace.hint.str());

    return out;
}

void ignoreExceptionInDestructor(Verbosity lvl)
{
    try {
        try {
            throw;
        } catch (std::exception & e) {
            printMsg(lvl, "error (ignored): %1%", e.what());
        }
    } catch (...) { }
}

}

#include "awsctx/util/error.hh"
#include "awsctx/util/logging.hh"
#include "awsctx/util/strings.hh"
#include "awsctx/util/terminal.hh"

#include <sstream>
#include <vector>

namespace awsctx {

void BaseError::addTrace(HintFmt hint)
{
    err.traces.push_front(Trace{.hint = hint});
    what_.reset();
}

const std::string & BaseError::calcWhat() const
{
    if (!what_) {
        std::ostringstream oss;
        showErrorInfo(oss, err, loggerSettings.showTrace);
        what_ = oss.str();
    }
    return *what_;
}

std::ostream & operator<<(std::ostream & os, const HintFmt & hf)
{
    return os << hf.str();
}

static std::string levelPrefix(Verbosity lvl)
{
    switch (lvl) {
    case lvlError:
        return ANSI_RED "error:" ANSI_NORMAL " ";
    case lvlWarn:
        return ANSI_WARNING "warning:" ANSI_NORMAL " ";
    case lvlNotice:
        return ANSI_RED "note:" ANSI_NORMAL " ";
    case lvlDebug:
        return ANSI_WARNING "debug:" ANSI_NORMAL " ";
    default:
        return ANSI_GREEN "info:" ANSI_NORMAL " ";
    }
}

std::ostream & showErrorInfo(std::ostream & out, const ErrorInfo & einfo, bool showTrace)
{
    auto prefix = levelPrefix(einfo.level);

    std::vector<std::string> traces;
    for (auto & trace : einfo.traces)
        if (auto hint = trace.hint.str(); !hint.empty())
            traces.push_back(hint);

    size_t skip = !showTrace && traces.size() > 3 ? traces.size() - 3 : 0;

    std::ostringstream oss;
    if (skip)
        oss << "\n" ANSI_WARNING "(trace truncated; set 'show-trace = true' to show the full trace)" ANSI_NORMAL "\n";
    for (size_t i = skip; i < traces.size(); ++i)
        oss << "\n… " << traces[i] << "\n";
    if (!traces.empty())
        oss << "\n" << prefix;
    oss << einfo.msg << "\n";

    out << indent(prefix, std::string(filterANSIEscapes(prefix, true).size(), ' '), chomp(oss.str()));
    return out;
}

void ignoreException(Verbosity lvl)
{
    try {
        throw;
    } catch (const Error & e) {
        printMsg(lvl, ANSI_RED "error (ignored):" ANSI_NORMAL " %s", e.msg());
    } catch (const std::exception & e) {
        printMsg(lvl, ANSI_RED "error (ignored):" ANSI_NORMAL " %s", e.what());
    } catch (...) {
        printMsg(lvl, ANSI_RED "error (ignored):" ANSI_NORMAL " unknown exception");
    }
}

} // namespace awsctx

#include "awsctx/util/logging.hh"
#include "awsctx/util/config-global.hh"
#include "awsctx/util/environment-variables.hh"
#include "awsctx/util/file-descriptor.hh"
#include "awsctx/util/terminal.hh"

#include <sstream>
#include <unistd.h>

namespace awsctx {

LoggerSettings loggerSettings;

static GlobalConfig::Register rLoggerSettings(&loggerSettings);

Verbosity verbosity = lvlInfo;

std::unique_ptr<Logger> logger = makeSimpleLogger();

void Logger::warn(const std::string & msg)
{
    log(lvlWarn, ANSI_WARNING "warning:" ANSI_NORMAL " " + msg);
}

/**
 * The `sd-daemon(3)` priority of a verbosity level.
 */
static char systemdPriority(Verbosity lvl)
{
    switch (lvl) {
    case lvlError:
        return '3';
    case lvlWarn:
        return '4';
    case lvlNotice:
    case lvlInfo:
        return '5';
    case lvlTalkative:
    case lvlChatty:
        return '6';
    default:
        return '7';
    }
}

class SimpleLogger : public Logger
{
    const bool systemd = getEnv("IN_SYSTEMD") == "1";
    const bool tty = isTTY();

public:

    void log(Verbosity lvl, std::string_view s) override
    {
        if (lvl > verbosity)
            return;

        std::string line;
        if (systemd)
            line = std::string("<") + systemdPriority(lvl) + ">";
        line += filterANSIEscapes(s, !tty);
        line += '\n';

        writeToStderr(line);
    }

    void logEI(const ErrorInfo & ei) override
    {
        std::ostringstream oss;
        showErrorInfo(oss, ei, loggerSettings.showTrace.get());
        log(ei.level, oss.str());
    }
};

std::unique_ptr<Logger> makeSimpleLogger()
{
    return std::make_unique<SimpleLogger>();
}

void writeToStderr(std::string_view s)
{
    try {
        writeFull(STDERR_FILENO, s);
    } catch (SystemError &) {
        /* A closed stderr must not stop the caller. */
    }
}

} // namespace awsctx

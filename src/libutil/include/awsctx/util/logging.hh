#pragma once
///@file

#include "awsctx/util/error.hh"
#include "awsctx/util/configuration.hh"

#include <memory>

namespace awsctx {

struct LoggerSettings : Config
{
    Setting<bool> showTrace{
        this,
        false,
        "show-trace",
        R"(
          Whether to print every trace item attached to an error, rather
          than only the innermost three.
        )"};
};

extern LoggerSettings loggerSettings;

class Logger
{
public:

    virtual ~Logger() {}

    virtual void log(Verbosity lvl, std::string_view s) = 0;

    /**
     * Render `ei` with its traces and log it at `ei.level`.
     */
    virtual void logEI(const ErrorInfo & ei) = 0;

    virtual void warn(const std::string & msg);
};

extern std::unique_ptr<Logger> logger;

/**
 * A logger that writes to stderr, dropping colours unless stderr is a
 * terminal. Under systemd (`IN_SYSTEMD=1`) each line gets an
 * `sd-daemon(3)` priority prefix.
 */
std::unique_ptr<Logger> makeSimpleLogger();

/**
 * Messages above this level are dropped.
 */
extern Verbosity verbosity;

/**
 * Log a `fmt`-style message at `level`. A macro so that the arguments
 * are only evaluated when the message is going to be printed.
 */
#define printMsg(level, args...)                                \
    do {                                                        \
        auto __lvl = level;                                     \
        if (__lvl <= awsctx::verbosity)                         \
            awsctx::logger->log(__lvl, awsctx::fmt(args));      \
    } while (0)

#define printTalkative(args...) printMsg(awsctx::lvlTalkative, args)
#define debug(args...) printMsg(awsctx::lvlDebug, args)
#define vomit(args...) printMsg(awsctx::lvlVomit, args)

/**
 * Log a `fmt`-style message with a `warning:` prefix.
 */
template<typename... Args>
inline void warn(const std::string & fs, const Args &... args)
{
    boost::format f(fs);
    setExceptions(f);
    formatHelper(f, args...);
    logger->warn(f.str());
}

void writeToStderr(std::string_view s);

} // namespace awsctx

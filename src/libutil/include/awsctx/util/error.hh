#pragma once
/**
 * @file
 *
 * @brief Error handling for awsctx.
 *
 * `ErrorInfo` is the payload of every awsctx exception: a verbosity
 * level, a formatted message and an optional list of traces that give
 * context ("while writing setting 'aws.profile'"). Conversion to a
 * string happens when the error is shown, not where it is thrown.
 *
 * `BaseError` is the ancestor of all awsctx exceptions. Callers should
 * catch `Error`.
 */

#include "awsctx/util/fmt.hh"

#include <cerrno>
#include <cstring>
#include <exception>
#include <list>
#include <optional>
#include <string>

namespace awsctx {

typedef enum { lvlError = 0, lvlWarn, lvlNotice, lvlInfo, lvlTalkative, lvlChatty, lvlDebug, lvlVomit } Verbosity;

struct Trace
{
    HintFmt hint;
};

struct ErrorInfo
{
    Verbosity level;
    HintFmt msg;

    /**
     * Outermost first.
     */
    std::list<Trace> traces;
};

/**
 * Render `einfo` as `error: <msg>`, preceded by its traces. Without
 * `showTrace` only the innermost three traces are printed.
 */
std::ostream & showErrorInfo(std::ostream & out, const ErrorInfo & einfo, bool showTrace);

/**
 * BaseError should generally not be caught directly. Catch Error instead.
 */
class BaseError : public std::exception
{
protected:
    mutable ErrorInfo err;

    /**
     * `err` rendered by `showErrorInfo()`, computed on first use.
     */
    mutable std::optional<std::string> what_;

    const std::string & calcWhat() const;

public:
    BaseError(const BaseError &) = default;
    BaseError & operator=(const BaseError &) = default;
    BaseError & operator=(BaseError &&) = default;

    template<typename... Args>
    explicit BaseError(const std::string & fs, const Args &... args)
        : err{.level = lvlError, .msg = HintFmt(fs, args...)}
    {
    }

    BaseError(HintFmt hint)
        : err{.level = lvlError, .msg = hint}
    {
    }

    /**
     * The bare message, for embedding in another message.
     */
    std::string message() const
    {
        return err.msg.str();
    }

    const char * what() const noexcept override
    {
        return calcWhat().c_str();
    }

    /**
     * The full rendering, with the `error:` prefix and traces.
     */
    const std::string & msg() const
    {
        return calcWhat();
    }

    const ErrorInfo & info() const
    {
        return err;
    }

    /**
     * Add context to the error as it propagates outwards.
     */
    template<typename... Args>
    void addTrace(std::string_view fs, const Args &... args)
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
 * Catch this; throw `SysError`.
 */
MakeError(SystemError, Error);

/**
 * A failed system call. The message gets `strerror(errNo)` appended.
 */
class SysError : public SystemError
{
public:
    int errNo;

    template<typename... Args>
    SysError(int errNo, const Args &... args)
        : SystemError("")
        , errNo(errNo)
    {
        err.msg = HintFmt("%1%: %2%", Uncolored(HintFmt(args...).str()), strerror(errNo));
    }

    /**
     * Uses the ambient `errno`, so construct it right after the failing
     * call.
     */
    template<typename... Args>
    SysError(const Args &... args)
        : SysError(errno, args...)
    {
    }
};

/**
 * Log the in-flight exception at level `lvl` and swallow it. Only for
 * use where an exception must not propagate, such as destructors and
 * listener fan-out.
 */
void ignoreException(Verbosity lvl = lvlError);

} // namespace awsctx

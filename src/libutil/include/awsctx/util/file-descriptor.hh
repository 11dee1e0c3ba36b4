#pragma once
///@file

#include <string>
#include <string_view>

namespace awsctx {

/**
 * Read from `fd` until end of file.
 */
std::string readFile(int fd);

/**
 * Write all of `s` to `fd`, retrying on short writes and `EINTR`.
 */
void writeFull(int fd, std::string_view s);

/**
 * Owns a file descriptor and closes it on destruction. Call `close()`
 * explicitly where a failing close must be reported.
 */
class AutoCloseFD
{
    int fd = -1;

public:
    AutoCloseFD() = default;
    AutoCloseFD(int fd);
    AutoCloseFD(AutoCloseFD && that) noexcept;
    AutoCloseFD(const AutoCloseFD &) = delete;
    AutoCloseFD & operator=(const AutoCloseFD &) = delete;
    ~AutoCloseFD();

    int get() const
    {
        return fd;
    }

    explicit operator bool() const
    {
        return fd != -1;
    }

    void close();

    void fsync() const;
};

} // namespace awsctx

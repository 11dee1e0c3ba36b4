#include "awsctx/util/file-descriptor.hh"
#include "awsctx/util/error.hh"

#include <cerrno>
#include <unistd.h>

namespace awsctx {

std::string readFile(int fd)
{
    std::string res;
    char buf[64 * 1024];
    for (;;) {
        auto n = read(fd, buf, sizeof(buf));
        if (n == 0)
            return res;
        if (n > 0)
            res.append(buf, n);
        else if (errno != EINTR)
            throw SysError("reading from file descriptor %d", fd);
    }
}

void writeFull(int fd, std::string_view s)
{
    while (!s.empty()) {
        auto n = write(fd, s.data(), s.size());
        if (n >= 0)
            s.remove_prefix(n);
        else if (errno != EINTR)
            throw SysError("writing to file descriptor %d", fd);
    }
}

AutoCloseFD::AutoCloseFD(int fd)
    : fd(fd)
{
}

AutoCloseFD::AutoCloseFD(AutoCloseFD && that) noexcept
    : fd(that.fd)
{
    that.fd = -1;
}

AutoCloseFD::~AutoCloseFD()
{
    try {
        close();
    } catch (...) {
        ignoreException();
    }
}

void AutoCloseFD::close()
{
    if (fd == -1)
        return;
    auto old = fd;
    fd = -1;
    if (::close(old) == -1)
        throw SysError("closing file descriptor %d", old);
}

void AutoCloseFD::fsync() const
{
    if (fd != -1 && ::fsync(fd) == -1)
        throw SysError("syncing file descriptor %d", fd);
}

} // namespace awsctx

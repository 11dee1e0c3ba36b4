#include "awsctx/util/file-system.hh"
#include "awsctx/util/environment-variables.hh"
#include "awsctx/util/error.hh"
#include "awsctx/util/file-descriptor.hh"
#include "awsctx/util/logging.hh"

#include <atomic>
#include <fcntl.h>
#include <random>
#include <sys/stat.h>
#include <unistd.h>

namespace awsctx {

bool pathExists(const std::filesystem::path & path)
{
    struct stat st;
    if (lstat(path.c_str(), &st) == 0)
        return true;
    if (errno != ENOENT && errno != ENOTDIR)
        throw SysError("getting status of '%s'", path.string());
    return false;
}

std::string readFile(const std::filesystem::path & path)
{
    AutoCloseFD fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (!fd)
        throw SysError("opening file '%s'", path.string());
    return readFile(fd.get());
}

void writeFile(const std::filesystem::path & path, std::string_view s, mode_t mode, bool sync)
{
    AutoCloseFD fd = open(path.c_str(), O_WRONLY | O_TRUNC | O_CREAT | O_CLOEXEC, mode);
    if (!fd)
        throw SysError("opening file '%s'", path.string());

    try {
        writeFull(fd.get(), s);
        if (sync)
            fd.fsync();
        fd.close();
    } catch (Error & e) {
        e.addTrace("while writing file '%s'", path.string());
        throw;
    }
}

/**
 * A path in `dir` that no other process of ours is using.
 */
static std::filesystem::path uniquePath(const std::filesystem::path & dir, const std::string & prefix)
{
    static std::atomic<uint32_t> counter(std::random_device{}());
    return dir / fmt("%s-%d-%d", prefix, getpid(), counter++);
}

void replaceFile(const std::filesystem::path & path, std::string_view s, mode_t mode)
{
    auto dir = path.has_parent_path() ? path.parent_path() : std::filesystem::path(".");
    auto tmp = uniquePath(dir, "." + path.filename().string() + ".tmp");
    AutoDelete delTmp(tmp, false);

    writeFile(tmp, s, mode, true);

    if (rename(tmp.c_str(), path.c_str()) == -1)
        throw SysError("moving '%s' to '%s'", tmp.string(), path.string());

    delTmp.cancel();
}

void createDirs(const std::filesystem::path & path)
{
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec)
        throw SysError(ec.value(), "creating directory '%s'", path.string());
}

std::filesystem::path createTempDir(const std::string & prefix)
{
    std::filesystem::path root = getEnvNonEmpty("TMPDIR").value_or("/tmp");
    for (;;) {
        auto dir = uniquePath(root, prefix);
        if (mkdir(dir.c_str(), 0755) == 0)
            return dir;
        if (errno != EEXIST)
            throw SysError("creating directory '%s'", dir.string());
    }
}

AutoDelete::AutoDelete(const std::filesystem::path & p, bool recursive)
    : _path(p)
    , recursive(recursive)
{
}

AutoDelete::~AutoDelete()
{
    if (!del)
        return;
    std::error_code ec;
    if (recursive)
        std::filesystem::remove_all(_path, ec);
    else
        std::filesystem::remove(_path, ec);
    if (ec)
        warn("cannot delete '%s': %s", _path.string(), ec.message());
}

} // namespace awsctx

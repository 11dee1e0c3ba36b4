#pragma once
/**
 * @file
 *
 * Reading, writing and atomically replacing files.
 */

#include "awsctx/util/types.hh"

#include <filesystem>
#include <sys/types.h>

namespace awsctx {

/**
 * Whether `path` exists. Failures other than a missing path or a
 * non-directory component throw `SysError`.
 */
bool pathExists(const std::filesystem::path & path);

std::string readFile(const std::filesystem::path & path);

/**
 * Create or truncate `path` and write `s` to it. With `sync`, the data
 * is flushed to disk before returning.
 */
void writeFile(const std::filesystem::path & path, std::string_view s, mode_t mode = 0666, bool sync = false);

/**
 * Replace the contents of `path` with `s` such that readers observe
 * either the old or the new contents, never a partial write. The data
 * is written to a temporary file next to `path`, synced, and renamed
 * over it.
 */
void replaceFile(const std::filesystem::path & path, std::string_view s, mode_t mode = 0666);

/**
 * Create a directory and any missing parents.
 */
void createDirs(const std::filesystem::path & path);

/**
 * Create a fresh directory under $TMPDIR (or /tmp).
 */
std::filesystem::path createTempDir(const std::string & prefix = "awsctx");

/**
 * Removes a path (recursively, by default) when it goes out of scope,
 * unless `cancel()` was called.
 */
class AutoDelete
{
    std::filesystem::path _path;
    bool del = true;
    bool recursive;

public:
    AutoDelete(const std::filesystem::path & p, bool recursive = true);
    AutoDelete(const AutoDelete &) = delete;
    ~AutoDelete();

    void cancel()
    {
        del = false;
    }

    const std::filesystem::path & path() const
    {
        return _path;
    }
};

} // namespace awsctx

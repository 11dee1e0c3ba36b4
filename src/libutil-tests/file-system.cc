#include "awsctx/util/file-system.hh"
#include "awsctx/util/error.hh"

#include <gtest/gtest.h>

#include <sys/stat.h>

namespace awsctx {

/* ----------------------------------------------------------------------------
 * createTempDir, AutoDelete
 * --------------------------------------------------------------------------*/

TEST(createTempDir, createsDirectoryRemovedByAutoDelete)
{
    std::filesystem::path dir;
    {
        AutoDelete tmpDir(createTempDir());
        dir = tmpDir.path();
        ASSERT_TRUE(std::filesystem::is_directory(dir));
        writeFile(dir / "file", "contents");
    }
    ASSERT_FALSE(pathExists(dir));
}

TEST(AutoDelete, cancelKeepsPath)
{
    auto dir = createTempDir();
    {
        AutoDelete del(dir);
        del.cancel();
    }
    ASSERT_TRUE(pathExists(dir));
    std::filesystem::remove(dir);
}

/* ----------------------------------------------------------------------------
 * readFile, writeFile, replaceFile
 * --------------------------------------------------------------------------*/

TEST(readFile, missingFileThrows)
{
    AutoDelete tmpDir(createTempDir());
    ASSERT_THROW(readFile(tmpDir.path() / "missing"), SysError);
}

TEST(writeFile, truncatesExistingContents)
{
    AutoDelete tmpDir(createTempDir());
    auto path = tmpDir.path() / "file";

    writeFile(path, "a longer first version\n");
    writeFile(path, "short\n", 0644, true);
    ASSERT_EQ(readFile(path), "short\n");
}

TEST(pathExists, nonDirectoryComponentIsMissing)
{
    AutoDelete tmpDir(createTempDir());
    writeFile(tmpDir.path() / "file", "");

    ASSERT_TRUE(pathExists(tmpDir.path() / "file"));
    ASSERT_FALSE(pathExists(tmpDir.path() / "file" / "child"));
}

TEST(replaceFile, replacesContentsAndMode)
{
    AutoDelete tmpDir(createTempDir());
    auto path = tmpDir.path() / "state.json";

    writeFile(path, "old");
    replaceFile(path, "new", 0600);

    ASSERT_EQ(readFile(path), "new");

    struct stat st;
    ASSERT_EQ(stat(path.c_str(), &st), 0);
    ASSERT_EQ(st.st_mode & 0777, 0600u);
}

TEST(replaceFile, leavesNoTemporaryFiles)
{
    AutoDelete tmpDir(createTempDir());
    auto path = tmpDir.path() / "state.json";

    replaceFile(path, "a");
    replaceFile(path, "b");

    size_t entries = 0;
    for ([[maybe_unused]] auto & entry : std::filesystem::directory_iterator(tmpDir.path()))
        entries++;
    ASSERT_EQ(entries, 1u);
}

TEST(replaceFile, missingDirectoryThrows)
{
    AutoDelete tmpDir(createTempDir());
    ASSERT_THROW(replaceFile(tmpDir.path() / "no" / "such" / "file", "x"), SysError);
}

/* ----------------------------------------------------------------------------
 * createDirs
 * --------------------------------------------------------------------------*/

TEST(createDirs, createsParents)
{
    AutoDelete tmpDir(createTempDir());
    auto path = tmpDir.path() / "a" / "b" / "c";

    createDirs(path);
    ASSERT_TRUE(std::filesystem::is_directory(path));
    createDirs(path);
}

} // namespace awsctx

#include "awsctx/util/users.hh"
#include "awsctx/util/environment-variables.hh"
#include "awsctx/util/logging.hh"
#include "awsctx/util/strings.hh"

#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

namespace awsctx {

static std::filesystem::path getPasswdHome()
{
    std::vector<char> buf(16384);
    struct passwd pwbuf;
    struct passwd * pw = nullptr;
    if (getpwuid_r(geteuid(), &pwbuf, buf.data(), buf.size(), &pw) != 0 || !pw || !pw->pw_dir || !*pw->pw_dir)
        throw Error("cannot determine the home directory of uid %d", geteuid());
    return pw->pw_dir;
}

std::filesystem::path getHome()
{
    static const std::filesystem::path home = [] {
        auto dir = getEnvNonEmpty("HOME");
        if (!dir)
            return getPasswdHome();

        struct stat st;
        if (stat(dir->c_str(), &st) == 0 && st.st_uid != geteuid()) {
            warn("$HOME ('%s') is not owned by you, using the home directory from the password database", *dir);
            return getPasswdHome();
        }
        return std::filesystem::path(*dir);
    }();
    return home;
}

/**
 * Resolve an XDG base directory: `override` verbatim, else `awsctx`
 * under `xdgVar`, else `awsctx` under `homeRelative` in the home
 * directory.
 */
static std::filesystem::path
xdgDir(const std::string & override, const std::string & xdgVar, const std::filesystem::path & homeRelative)
{
    if (auto dir = getEnvNonEmpty(override))
        return *dir;
    if (auto dir = getEnvNonEmpty(xdgVar))
        return std::filesystem::path(*dir) / "awsctx";
    return getHome() / homeRelative / "awsctx";
}

std::filesystem::path getConfigDir()
{
    return xdgDir("AWSCTX_CONFIG_HOME", "XDG_CONFIG_HOME", ".config");
}

std::vector<std::filesystem::path> getConfigDirs()
{
    std::vector<std::filesystem::path> dirs{getConfigDir()};
    for (auto & dir : tokenizeString<Strings>(getEnv("XDG_CONFIG_DIRS").value_or("/etc/xdg"), ":"))
        dirs.push_back(std::filesystem::path(dir) / "awsctx");
    return dirs;
}

std::filesystem::path getStateDir()
{
    return xdgDir("AWSCTX_STATE_HOME", "XDG_STATE_HOME", std::filesystem::path(".local") / "state");
}

std::string expandTilde(std::string_view path)
{
    if (path == "~" || path.substr(0, 2) == "~/")
        return getHome().string() + std::string(path.substr(1));
    return std::string(path);
}

} // namespace awsctx

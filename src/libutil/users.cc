#include "sdbg/util/users.hh"
#include "sdbg/util/environment-variables.hh"
#include "sdbg/util/error.hh"
#include "sdbg/util/file-system.hh"
#include "sdbg/util/strings.hh"

#include <pwd.h>
#include <unistd.h>

namespace sdbg {

static std::filesystem::path passwdHome()
{
    std::vector<char> buf(16384);
    struct passwd pwbuf;
    struct passwd * pw = nullptr;
    if (getpwuid_r(geteuid(), &pwbuf, buf.data(), buf.size(), &pw) != 0 || !pw || !pw->pw_dir || !*pw->pw_dir)
        throw Error("cannot determine the home directory of user %d", geteuid());
    return pw->pw_dir;
}

std::filesystem::path getHome()
{
    static const std::filesystem::path home = [] {
        auto env = getEnvNonEmpty("HOME");
        if (env && pathExists(*env))
            return std::filesystem::path(*env);
        return passwdHome();
    }();
    return home;
}

/**
 * `envVar` if set, else `<xdgVar>/stupid-dbg`, else `~/<fallback>/stupid-dbg`.
 */
static std::filesystem::path
userDir(const std::string & envVar, const std::string & xdgVar, const std::filesystem::path & fallback)
{
    if (auto dir = getEnv(envVar))
        return *dir;
    if (auto xdg = getEnvNonEmpty(xdgVar))
        return std::filesystem::path(*xdg) / "stupid-dbg";
    return getHome() / fallback / "stupid-dbg";
}

std::vector<std::filesystem::path> getConfigDirs()
{
    std::vector<std::filesystem::path> dirs{userDir("SDBG_CONFIG_HOME", "XDG_CONFIG_HOME", ".config")};
    for (auto & dir : tokenizeString<Strings>(getEnvNonEmpty("XDG_CONFIG_DIRS").value_or("/etc/xdg"), ":"))
        dirs.push_back(std::filesystem::path(dir) / "stupid-dbg");
    return dirs;
}

std::filesystem::path getDataDir()
{
    return userDir("SDBG_DATA_HOME", "XDG_DATA_HOME", std::filesystem::path(".local") / "share");
}

} // namespace sdbg

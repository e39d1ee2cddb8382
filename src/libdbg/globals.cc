#include "sdbg/dbg/globals.hh"
#include "sdbg/util/config-global.hh"
#include "sdbg/util/environment-variables.hh"
#include "sdbg/util/file-system.hh"
#include "sdbg/util/logging.hh"
#include "sdbg/util/strings.hh"
#include "sdbg/util/users.hh"

namespace sdbg {

Settings settings;

static GlobalConfig::Register rSettings(&settings);

Settings::Settings()
    : userConfFiles(getUserConfigFiles())
{
}

std::optional<Path> Settings::getDefaultHistoryFile()
{
    try {
        return (getDataDir() / "history").string();
    } catch (Error & e) {
        debug("not keeping REPL history: %s", e.message());
        return std::nullopt;
    }
}

std::vector<Path> getUserConfigFiles()
{
    if (auto files = getEnv("SDBG_USER_CONF_FILES"))
        return tokenizeString<std::vector<std::string>>(*files, ":");

    std::vector<Path> files;
    for (auto & dir : getConfigDirs())
        files.push_back((dir / "stupid-dbg.conf").string());
    return files;
}

void loadConfFile(AbstractConfig & config)
{
    auto applyConfigFile = [&](const Path & path) {
        if (!pathExists(path))
            return;
        try {
            std::string contents = readFile(path);
            config.applyConfig(contents, path);
        } catch (SystemError & e) {
            warn("unable to read configuration file '%s': %s", path, e.message());
        }
    };

    /* Least specific first, so that user files override system ones. */
    auto & files = settings.userConfFiles;
    for (auto file = files.rbegin(); file != files.rend(); file++)
        applyConfigFile(*file);

    if (auto conf = getEnv("SDBG_CONFIG"))
        config.applyConfig(*conf, "SDBG_CONFIG");
}

} // namespace sdbg

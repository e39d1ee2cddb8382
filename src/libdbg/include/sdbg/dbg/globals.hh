#pragma once
///@file

#include "sdbg/util/configuration.hh"
#include "sdbg/util/types.hh"

#include <vector>

namespace sdbg {

class Settings : public Config
{
    static std::optional<Path> getDefaultHistoryFile();

public:

    Settings();

    /**
     * The configuration files read at start-up, most specific first.
     */
    std::vector<Path> userConfFiles;

    OptionalPathSetting historyFile{
        this,
        getDefaultHistoryFile(),
        "history-file",
        R"(
          The file in which the command history of the interactive
          debugger is kept between sessions. Set it to the empty string
          to keep no history.
        )"};

    Setting<unsigned int> historySize{
        this,
        1000,
        "history-size",
        R"(
          The maximum number of lines kept in `history-file`.
        )"};

    Setting<std::string> prompt{
        this,
        "dbg> ",
        "prompt",
        R"(
          The prompt shown by the interactive debugger.
        )"};

    Setting<bool> killSpawnedOnDetach{
        this,
        true,
        "kill-spawned-on-detach",
        R"(
          Whether to kill a debuggee started with `run` when detaching
          from it (including when the debugger exits). Processes that
          were attached to with `attach` are always left running.
        )"};

    Setting<bool> stopAttachedOnInterrupt{
        this,
        true,
        "stop-attached-on-interrupt",
        R"(
          Whether pressing Ctrl-C while waiting for the debuggee sends it
          `SIGSTOP`, so that the wait ends and control returns to the
          debugger.
        )"};
};

extern Settings settings;

/**
 * The user configuration files, in the order they are read. Taken from
 * `SDBG_USER_CONF_FILES` (colon separated) if set, otherwise
 * `stupid-dbg.conf` in each of `getConfigDirs()`.
 */
std::vector<Path> getUserConfigFiles();

/**
 * Apply the configuration files and `SDBG_CONFIG` to `config`.
 */
void loadConfFile(AbstractConfig & config);

} // namespace sdbg

#include "sdbg/main/shared.hh"
#include "sdbg/dbg/globals.hh"
#include "sdbg/util/config-global.hh"
#include "sdbg/util/logging.hh"
#include "sdbg/util/signals.hh"
#include "sdbg/util/strings.hh"

#include <iostream>

#include <signal.h>

namespace sdbg {

const std::string sdbgVersion = SDBG_VERSION;

void initSdbg(bool loadConfig)
{
    if (loadConfig) {
        loadConfFile(globalConfig);
        globalConfig.warnUnknownSettings();
    }

    /* waitpid() must see our debuggees even if the parent left SIGCHLD
       ignored. */
    struct sigaction act = {};
    act.sa_handler = SIG_DFL;
    sigemptyset(&act.sa_mask);
    if (sigaction(SIGCHLD, &act, nullptr))
        throw SysError("resetting SIGCHLD");
}

void printVersion(const std::string & programName)
{
    std::cout << programName << " " << sdbgVersion << "\n";
    if (verbosity >= lvlTalkative) {
        std::cout << "Configuration files: " << concatStringsSep(":", settings.userConfFiles) << "\n";
        std::cout << "History file: " << settings.historyFile.to_string() << "\n";
    }
    throw Exit();
}

int handleExceptions(const std::string & programName, std::function<void()> fun)
{
    ReceiveInterrupts receiveInterrupts;

    try {
        fun();
        return 0;
    } catch (Exit & e) {
        return e.status;
    } catch (UsageError & e) {
        logError(e.info());
        printError("Try '%s --help' for more information.", programName);
        return 1;
    } catch (BaseError & e) {
        logError(e.info());
        return e.info().status;
    } catch (std::bad_alloc &) {
        printError(ANSI_RED "error:" ANSI_NORMAL " out of memory");
        return 1;
    } catch (std::exception & e) {
        printError(ANSI_RED "error:" ANSI_NORMAL " %s", e.what());
        return 1;
    }
}

} // namespace sdbg

#include "sdbg/main/common-args.hh"
#include "sdbg/main/loggers.hh"
#include "sdbg/util/config-global.hh"
#include "sdbg/util/logging.hh"

namespace sdbg {

static constexpr auto settingsCategory = "Options to override configuration settings";

MixCommonArgs::MixCommonArgs(const std::string & programName)
    : programName(programName)
{
    addFlag({
        .longName = "verbose",
        .shortName = 'v',
        .description = "Show more log messages. May be repeated.",
        .category = loggingCategory,
        .handler = {[]() {
            if (verbosity < lvlVomit)
                verbosity = (Verbosity) (verbosity + 1);
        }},
    });

    addFlag({
        .longName = "quiet",
        .description = "Show fewer log messages. May be repeated.",
        .category = loggingCategory,
        .handler = {[]() {
            if (verbosity > lvlError)
                verbosity = (Verbosity) (verbosity - 1);
        }},
    });

    addFlag({
        .longName = "debug",
        .description = "Show debug messages.",
        .category = loggingCategory,
        .handler = {&verbosity, lvlDebug},
    });

    addFlag({
        .longName = "log-format",
        .description = "How log messages are written to stderr: `raw` or `internal-json`.",
        .category = loggingCategory,
        .labels = {"format"},
        .handler = {[](std::string format) { setLogFormat(format); }},
    });

    addFlag({
        .longName = "option",
        .description = "Set the setting *name* to *value*, taking precedence over `stupid-dbg.conf`.",
        .category = miscCategory,
        .labels = {"name", "value"},
        .handler = {[](std::string name, std::string value) {
            try {
                if (!globalConfig.set(name, value))
                    warn("unknown setting '%s'", name);
            } catch (UsageError & e) {
                logWarning(e.info());
            }
        }},
    });

    globalConfig.convertToArgs(*this, settingsCategory);
    hiddenCategories.insert(settingsCategory);
}

} // namespace sdbg

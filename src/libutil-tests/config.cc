#include "sdbg/util/configuration.hh"
#include "sdbg/util/args.hh"
#include "sdbg/util/config-global.hh"
#include "sdbg/util/logging.hh"
#include "sdbg/util/terminal.hh"

#include <gtest/gtest.h>

namespace sdbg {

/* ----------------------------------------------------------------------------
 * Config
 * --------------------------------------------------------------------------*/

TEST(Config, setUndefinedSetting)
{
    Config config;
    ASSERT_EQ(config.set("undefined-key", "value"), false);
}

TEST(Config, setDefinedSetting)
{
    Config config;
    Setting<std::string> foo{&config, "", "name-of-the-setting", "description"};
    ASSERT_EQ(config.set("name-of-the-setting", "value"), true);
    ASSERT_EQ(foo.get(), "value");
}

TEST(Config, descriptionsLoseTheirIndentation)
{
    Config config;
    Setting<std::string> prompt{&config, "dbg> ", "prompt", R"(
      The prompt.
    )"};

    ASSERT_EQ(prompt.description, "The prompt.\n");
    ASSERT_EQ(prompt.to_string(), "dbg> ");
    ASSERT_EQ(prompt.defaultValue, "dbg> ");
}

TEST(Config, setBool)
{
    Config config;
    Setting<bool> flag{&config, true, "kill-spawned-on-detach", "description"};

    ASSERT_TRUE(config.set("kill-spawned-on-detach", "false"));
    ASSERT_FALSE(flag.get());
    ASSERT_TRUE(config.set("kill-spawned-on-detach", "true"));
    ASSERT_TRUE(flag.get());
    ASSERT_THROW(config.set("kill-spawned-on-detach", "maybe"), UsageError);
}

TEST(Config, setInteger)
{
    Config config;
    Setting<unsigned int> size{&config, 1000, "history-size", "description"};

    ASSERT_TRUE(config.set("history-size", "20"));
    ASSERT_EQ(size.get(), 20u);
    ASSERT_THROW(config.set("history-size", "lots"), UsageError);
}

TEST(Config, applyConfigWithCommentsAndBlankLines)
{
    Config config;
    Setting<std::string> prompt{&config, "", "prompt", "description"};
    Setting<bool> flag{&config, true, "stop-attached-on-interrupt", "description"};

    config.applyConfig(
        "# a comment\n"
        "\n"
        "prompt = (dbg) # trailing comment\n"
        "stop-attached-on-interrupt = false\n");

    ASSERT_EQ(prompt.get(), "(dbg)");
    ASSERT_FALSE(flag.get());
}

TEST(Config, applyConfigJoinsMultiWordValues)
{
    Config config;
    Setting<std::string> prompt{&config, "", "prompt", "description"};

    config.applyConfig("prompt = stupid  dbg>\n");

    ASSERT_EQ(prompt.get(), "stupid dbg>");
}

TEST(Config, applyConfigSyntaxError)
{
    Config config;
    Setting<std::string> prompt{&config, "", "prompt", "description"};

    ASSERT_THROW(config.applyConfig("prompt\n"), UsageError);
    ASSERT_THROW(config.applyConfig("prompt : foo\n"), UsageError);
}

TEST(Config, applyConfigUnknownSettingIsKept)
{
    Config config;
    config.applyConfig("future-setting = 1\n");

    Setting<std::string> later{&config, "", "future-setting", "description"};

    ASSERT_EQ(later.get(), "1");
}

TEST(Config, applyConfigLastValueWins)
{
    Config config;
    Setting<unsigned int> size{&config, 1000, "history-size", "description"};

    config.applyConfig("history-size = 10\nhistory-size = 20\n", "stupid-dbg.conf");

    ASSERT_EQ(size.get(), 20u);
}

TEST(Config, applyConfigReportsOrigin)
{
    Config config;

    try {
        config.applyConfig("prompt\n", "/etc/xdg/stupid-dbg.conf");
        FAIL() << "expected a syntax error";
    } catch (UsageError & e) {
        ASSERT_EQ(
            e.message(),
            "syntax error in configuration line '" ANSI_WARNING "prompt" ANSI_NORMAL "' in '" ANSI_WARNING
            "/etc/xdg/stupid-dbg.conf" ANSI_NORMAL "'");
    }
}

namespace {

struct WarningLogger : Logger
{
    Strings warnings;

    void log(Verbosity lvl, std::string_view s) override
    {
        if (lvl == lvlWarn)
            warnings.push_back(filterANSIEscapes(s, true));
    }

    void logEI(const ErrorInfo & ei) override
    {
        log(ei.level, ei.msg.str());
    }
};

} // namespace

TEST(Config, warnUnknownSettings)
{
    Config config;
    Setting<std::string> prompt{&config, "", "prompt", "description"};
    config.applyConfig("prompt = >\nhistroy-size = 5\n");

    auto previous = std::move(logger);
    auto capture = std::make_unique<WarningLogger>();
    auto & warnings = capture->warnings;
    logger = std::move(capture);
    config.warnUnknownSettings();
    auto captured = warnings;
    logger = std::move(previous);

    ASSERT_EQ(captured, Strings{"warning: unknown setting 'histroy-size'"});
    ASSERT_EQ(prompt.get(), ">");
}

static Config registeredConfig;
static Setting<std::string> registeredPrompt{&registeredConfig, "", "test-prompt", "description"};
static GlobalConfig::Register rRegisteredConfig(&registeredConfig);

TEST(GlobalConfig, setReachesRegisteredConfigs)
{
    ASSERT_TRUE(globalConfig.set("test-prompt", "(gdb) "));
    ASSERT_EQ(registeredPrompt.get(), "(gdb) ");
    ASSERT_FALSE(globalConfig.set("no-such-setting", "1"));
}

struct ConfigArgs : virtual Args
{
};

TEST(Config, convertToArgs)
{
    Config config;
    Setting<std::string> prompt{&config, "", "prompt", "description"};
    Setting<bool> flag{&config, false, "flag", "description"};

    ConfigArgs args;
    config.convertToArgs(args, "settings");
    args.parseCmdline({"--prompt", "p>", "--flag"});

    ASSERT_EQ(prompt.get(), "p>");
    ASSERT_TRUE(flag.get());

    args.parseCmdline({"--no-flag"});
    ASSERT_FALSE(flag.get());
}

/* ----------------------------------------------------------------------------
 * OptionalPathSetting
 * --------------------------------------------------------------------------*/

TEST(OptionalPathSetting, emptyMeansNone)
{
    Config config;
    OptionalPathSetting historyFile{&config, "/tmp/history", "history-file", "description"};

    ASSERT_TRUE(config.set("history-file", ""));
    ASSERT_EQ(historyFile.get(), std::nullopt);
}

TEST(OptionalPathSetting, pathsAreCanonicalised)
{
    Config config;
    OptionalPathSetting historyFile{&config, std::nullopt, "history-file", "description"};

    ASSERT_TRUE(config.set("history-file", "/tmp//sdbg/history/"));
    ASSERT_EQ(historyFile.get(), "/tmp/sdbg/history");
}

} // namespace sdbg

#include "sdbg/util/config-global.hh"
#include "sdbg/util/file-system.hh"
#include "sdbg/util/logging.hh"
#include "sdbg/util/strings.hh"

#include <filesystem>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <unistd.h>

namespace sdbg {

/**
 * Swaps in another `logger` and puts the previous one back when the
 * test ends.
 */
class LoggerTest : public ::testing::Test
{
    std::unique_ptr<Logger> previous;

protected:

    void SetUp() override
    {
        previous = std::move(logger);
        logger = makeSimpleLogger();
    }

    void TearDown() override
    {
        logger = std::move(previous);
    }

    static std::vector<nlohmann::json> parseRecords(std::string_view output, std::string_view prefix)
    {
        std::vector<nlohmann::json> records;
        for (auto & line : tokenizeString<Strings>(output, "\n")) {
            EXPECT_TRUE(hasPrefix(line, prefix)) << line;
            records.push_back(nlohmann::json::parse(line.substr(prefix.size())));
        }
        return records;
    }
};

TEST_F(LoggerTest, jsonMessages)
{
    Pipe pipe;
    pipe.create();
    logger = makeJSONLogger(pipe.writeSide.get());

    logger->log(lvlInfo, "attached to 1234");
    logger->logEI(lvlWarn, ErrorInfo{.msg = HintFmt("no such register '%s'", "rxa")});
    pipe.writeSide.close();

    auto records = parseRecords(drainFD(pipe.readSide.get()), "@sdbg ");
    ASSERT_EQ(records.size(), 2u);

    ASSERT_EQ(records[0]["action"], "msg");
    ASSERT_EQ(records[0]["level"], lvlInfo);
    ASSERT_EQ(records[0]["msg"], "attached to 1234");

    ASSERT_EQ(records[1]["action"], "msg");
    ASSERT_EQ(records[1]["level"], lvlWarn);
    ASSERT_EQ(records[1]["raw_msg"], "no such register '" ANSI_WARNING "rxa" ANSI_NORMAL "'");
}

TEST_F(LoggerTest, jsonActivities)
{
    Pipe pipe;
    pipe.create();
    logger = makeJSONLogger(pipe.writeSide.get());

    ActivityId outerId, innerId;
    {
        Activity outer(*logger, lvlTalkative, actRepl, "reading commands");
        outerId = outer.id;
        Activity inner(*logger, lvlDebug, actWait, "waiting for 1234", {uint64_t(1234)});
        innerId = inner.id;
        inner.result(resProcessState, std::string("stopped"), uint64_t(19));
    }
    pipe.writeSide.close();

    auto records = parseRecords(drainFD(pipe.readSide.get()), "@sdbg ");
    ASSERT_EQ(records.size(), 5u);

    ASSERT_EQ(records[0]["action"], "start");
    ASSERT_EQ(records[0]["type"], actRepl);
    ASSERT_EQ(records[0]["text"], "reading commands");

    ASSERT_EQ(records[1]["action"], "start");
    ASSERT_EQ(records[1]["parent"], outerId);
    ASSERT_EQ(records[1]["fields"], nlohmann::json::array({1234}));

    ASSERT_EQ(records[2]["action"], "result");
    ASSERT_EQ(records[2]["id"], innerId);
    ASSERT_EQ(records[2]["type"], resProcessState);
    ASSERT_EQ(records[2]["fields"], nlohmann::json::array({"stopped", 19}));

    ASSERT_EQ(records[3]["action"], "stop");
    ASSERT_EQ(records[3]["id"], innerId);
    ASSERT_EQ(records[4]["action"], "stop");
    ASSERT_EQ(records[4]["id"], outerId);

    ASSERT_EQ(getCurActivity(), 0u);
}

TEST_F(LoggerTest, jsonLogPathReceivesACopy)
{
    auto dir = std::filesystem::temp_directory_path() / ("sdbg-logging-test-" + std::to_string(getpid()));
    createDirs(dir);
    auto path = (dir / "log.json").string();

    ASSERT_TRUE(globalConfig.set("json-log-path", path));
    applyJSONLogger();
    ASSERT_TRUE(globalConfig.set("json-log-path", ""));

    logger->log(lvlError, "debuggee exited with status 3");
    logger = makeSimpleLogger();

    auto contents = readFile(path);
    std::filesystem::remove_all(dir);

    auto records = parseRecords(contents, "");
    ASSERT_EQ(records.size(), 1u);
    ASSERT_EQ(records[0]["action"], "msg");
    ASSERT_EQ(records[0]["level"], lvlError);
    ASSERT_EQ(records[0]["msg"], "debuggee exited with status 3");
}

TEST_F(LoggerTest, jsonLogPathUnsetKeepsLogger)
{
    ASSERT_TRUE(globalConfig.set("json-log-path", ""));
    auto * before = logger.get();

    applyJSONLogger();

    ASSERT_EQ(logger.get(), before);
}

} // namespace sdbg

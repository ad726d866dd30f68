#include <gtest/gtest.h>
#include <ArduinoJson.h>
#include "logger.h"
#include <string>
#include <vector>

class LoggerTest : public ::testing::Test {
protected:
    Logger testLog;
    std::vector<std::string> lines;
    uint32_t nowMs = 3723456;  // 1:02:03.456

    void SetUp() override {
        testLog.setClock([this]() { return nowMs; });
        testLog.setSink([this](const char* line) { lines.push_back(line); });
        testLog.begin(3);
    }
};

TEST_F(LoggerTest, FormatsConsoleLine) {
    testLog.info("bridge up");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "[1:02:03.456] INFO : bridge up\n");
}

TEST_F(LoggerTest, DebugGoesToConsoleOnly) {
    testLog.debug("raw bytes");
    EXPECT_EQ(lines.size(), 1u);
    EXPECT_TRUE(testLog.getEntries().empty());
}

TEST_F(LoggerTest, RingBufferKeepsNewestEntries) {
    for (int i = 0; i < 5; i++) {
        testLog.infof("entry %d", i);
    }
    std::vector<LogEntry> entries = testLog.getEntries();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].message, "entry 2");
    EXPECT_EQ(entries[2].message, "entry 4");
}

TEST_F(LoggerTest, MinLevelFiltersEverywhere) {
    testLog.setMinLevel(LOG_LEVEL_WARN);
    testLog.info("quiet");
    testLog.warn("loud");
    ASSERT_EQ(lines.size(), 1u);
    ASSERT_EQ(testLog.getEntries().size(), 1u);
    EXPECT_EQ(testLog.getEntries()[0].level, LOG_LEVEL_WARN);
}

TEST_F(LoggerTest, EntriesAsJson) {
    testLog.warnf("Connection lost: %s", "keepalive failed");
    testLog.error("gave up");

    DynamicJsonDocument doc(1024);
    ASSERT_FALSE(deserializeJson(doc, testLog.getEntriesJSON()));
    JsonArray entries = doc.as<JsonArray>();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_STREQ(entries[0]["timestamp"].as<const char*>(), "1:02:03.456");
    EXPECT_STREQ(entries[0]["message"].as<const char*>(), "Connection lost: keepalive failed");
    EXPECT_STREQ(entries[1]["level"].as<const char*>(), "ERROR");
}

TEST_F(LoggerTest, LongMessagesAreTruncated) {
    std::string big(1000, 'x');
    testLog.infof("%s", big.c_str());
    ASSERT_EQ(testLog.getEntries().size(), 1u);
    EXPECT_EQ(testLog.getEntries()[0].message.size(), 255u);
}

TEST_F(LoggerTest, ClearEmptiesBuffer) {
    testLog.info("a");
    testLog.clear();
    EXPECT_TRUE(testLog.getEntries().empty());
    EXPECT_EQ(testLog.getEntriesJSON(), "[]");
}

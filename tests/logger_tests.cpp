#include "gtest/gtest.h"
#include "utilities/logger.h"
#include "test_helpers.h"
#include <nlohmann/json.hpp>
#include <cstdio>
#include <filesystem>
#include <stdexcept>
#include <string>

using namespace mailcas;
using mailcas::test::readFileContents;
using mailcas::test::TempDir;

// Helper function to count occurrences of a substring
int countOccurrences(const std::string& text, const std::string& sub) {
    int count = 0;
    size_t pos = text.find(sub, 0);
    while (pos != std::string::npos) {
        count++;
        pos = text.find(sub, pos + sub.length());
    }
    return count;
}

// Test fixture for Logger tests
class LoggerTest : public ::testing::Test {
protected:
    TempDir dir_{"mailcas_logger"};

    void TearDown() override {
        // Release the handle on this test's files; the singleton outlives the test.
        Logger::init((std::filesystem::temp_directory_path() / "mailcas_test_var" / "logs" /
                      "mailcas_tests.log").string(),
                     LogLevel::DEBUG);
    }

    std::string logPath(const std::string& name) const { return dir_.sub(name); }
};

TEST_F(LoggerTest, LogLevelFiltering) {
    const std::string testLogFile = logPath("level_filter.log");
    ASSERT_NO_THROW(Logger::init(testLogFile, LogLevel::INFO));
    Logger& logger = Logger::getInstance();

    logger.log(LogLevel::TRACE, "This is a trace message.");
    logger.log(LogLevel::DEBUG, "This is a debug message.");
    logger.log(LogLevel::INFO, "This is an info message.");
    logger.log(LogLevel::WARN, "This is a warning message.");
    logger.log(LogLevel::ERROR, "This is an error message.");
    logger.log(LogLevel::FATAL, "This is a fatal message.");

    std::string logContents = readFileContents(testLogFile);
    ASSERT_NE(logContents, "");

    EXPECT_EQ(countOccurrences(logContents, "This is a trace message."), 0);
    EXPECT_EQ(countOccurrences(logContents, "This is a debug message."), 0);
    EXPECT_NE(logContents.find("This is an info message."), std::string::npos);
    EXPECT_NE(logContents.find("This is a warning message."), std::string::npos);
    EXPECT_NE(logContents.find("This is an error message."), std::string::npos);
    EXPECT_NE(logContents.find("This is a fatal message."), std::string::npos);
}

TEST_F(LoggerTest, SetLogLevelAtRuntime) {
    const std::string testLogFile = logPath("runtime_level.log");
    ASSERT_NO_THROW(Logger::init(testLogFile, LogLevel::ERROR));
    Logger& logger = Logger::getInstance();
    logger.log(LogLevel::INFO, "hidden before");
    logger.setLogLevel(LogLevel::DEBUG);
    EXPECT_EQ(logger.getLogLevel(), LogLevel::DEBUG);
    logger.log(LogLevel::DEBUG, "visible after");

    std::string logContents = readFileContents(testLogFile);
    EXPECT_EQ(logContents.find("hidden before"), std::string::npos);
    EXPECT_NE(logContents.find("visible after"), std::string::npos);
}

TEST_F(LoggerTest, JsonOutputFormat) {
    const std::string testLogFile = logPath("json_format.log");
    ASSERT_NO_THROW(Logger::init(testLogFile, LogLevel::DEBUG));
    Logger::getInstance().log(LogLevel::INFO, "Special chars \" \\ \n \t done");

    std::string logContents = readFileContents(testLogFile);
    ASSERT_NE(logContents, "");

    EXPECT_NE(logContents.find("\"level\":\"INFO\""), std::string::npos);
    EXPECT_NE(logContents.find("\"message\":\"Special chars \\\" \\\\ \\n \\t done\""), std::string::npos);
    EXPECT_NE(logContents.find("\"timestamp\":\""), std::string::npos);

    EXPECT_EQ(logContents.front(), '{');
    size_t last_char_pos = logContents.find_last_not_of("\n\r");
    ASSERT_NE(last_char_pos, std::string::npos);
    EXPECT_EQ(logContents[last_char_pos], '}');
    EXPECT_EQ(countOccurrences(logContents, "\n"), 1);
}

TEST_F(LoggerTest, LinesParseAsJsonEvenForInvalidUtf8) {
    const std::string testLogFile = logPath("json_bytes.log");
    ASSERT_NO_THROW(Logger::init(testLogFile, LogLevel::DEBUG));
    ASSERT_NO_THROW(Logger::getInstance().log(LogLevel::WARN, std::string("raw \xff\xfe bytes")));

    std::string logContents = readFileContents(testLogFile);
    auto line = nlohmann::ordered_json::parse(logContents.substr(0, logContents.find('\n')));
    EXPECT_EQ(line["level"].get<std::string>(), "WARN");
    EXPECT_EQ(line["message"].get<std::string>().rfind("raw ", 0), 0u);
    EXPECT_NE(line["message"].get<std::string>().find("bytes"), std::string::npos);
    EXPECT_EQ(line.begin().key(), "timestamp");
}

TEST_F(LoggerTest, LogRotation) {
    const std::string baseLogFile = logPath("rotation.log");
    const int maxBackupFiles = 2;
    const long long maxFileSize = 1024;

    ASSERT_NO_THROW(Logger::init(baseLogFile, LogLevel::DEBUG, maxFileSize, maxBackupFiles));
    Logger& logger = Logger::getInstance();

    std::string singleMessage = "Rotation test message. This message is intended to be somewhat long to help fill the log file quickly. ";
    for (int k = 0; k < 3; ++k) singleMessage += singleMessage; // ~800 bytes

    // Two messages overflow one file; eight fill the file and both backups
    // several times over.
    for (int i = 0; i < 8; ++i) {
        logger.log(LogLevel::INFO, singleMessage + " #" + std::to_string(i));
    }

    EXPECT_TRUE(std::filesystem::exists(baseLogFile));
    EXPECT_TRUE(std::filesystem::exists(baseLogFile + ".1"));
    EXPECT_TRUE(std::filesystem::exists(baseLogFile + ".2"));
    EXPECT_FALSE(std::filesystem::exists(baseLogFile + ".3"));
    EXPECT_NE(readFileContents(baseLogFile).find(" #7"), std::string::npos);
}

TEST_F(LoggerTest, LogRotationNoBackups) {
    const std::string baseLogFile = logPath("no_backup_rotation.log");
    ASSERT_NO_THROW(Logger::init(baseLogFile, LogLevel::DEBUG, 512, 0));
    Logger& logger = Logger::getInstance();

    std::string singleMessage = "No backup rotation test. This message is intended to be somewhat long. ";
    for (int k = 0; k < 2; ++k) singleMessage += singleMessage; // ~280 bytes
    for (int i = 0; i < 5; ++i) {
        logger.log(LogLevel::INFO, singleMessage + " #" + std::to_string(i));
    }

    EXPECT_TRUE(std::filesystem::exists(baseLogFile));
    EXPECT_FALSE(std::filesystem::exists(baseLogFile + ".1"));
}

// The latest init wins: new file, new level.
TEST_F(LoggerTest, ReinitializationTest) {
    const std::string logFile1 = logPath("reinit1.log");
    const std::string logFile2 = logPath("reinit2.log");

    ASSERT_NO_THROW(Logger::init(logFile1, LogLevel::INFO));
    Logger::getInstance().log(LogLevel::INFO, "Message for logfile1");

    ASSERT_NO_THROW(Logger::init(logFile2, LogLevel::WARN));
    Logger::getInstance().log(LogLevel::WARN, "Message for logfile2");
    Logger::getInstance().log(LogLevel::INFO, "Info message for logfile2");

    std::string contents1 = readFileContents(logFile1);
    EXPECT_NE(contents1.find("Message for logfile1"), std::string::npos);
    EXPECT_EQ(contents1.find("Message for logfile2"), std::string::npos);

    std::string contents2 = readFileContents(logFile2);
    EXPECT_NE(contents2.find("Message for logfile2"), std::string::npos);
    EXPECT_EQ(contents2.find("Info message for logfile2"), std::string::npos);
    EXPECT_EQ(contents2.find("Message for logfile1"), std::string::npos);
}

TEST(LogLevelParsing, AcceptsNamesCaseInsensitively) {
    EXPECT_EQ(logLevelFromString("TRACE"), LogLevel::TRACE);
    EXPECT_EQ(logLevelFromString("debug"), LogLevel::DEBUG);
    EXPECT_EQ(logLevelFromString("Info"), LogLevel::INFO);
    EXPECT_EQ(logLevelFromString("warning"), LogLevel::WARN);
    EXPECT_EQ(logLevelFromString("fatal"), LogLevel::FATAL);
    EXPECT_THROW(logLevelFromString(""), std::invalid_argument);
}

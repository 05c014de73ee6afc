#include "chunkforge/utilities/logger.h"
#include "chunkforge/utilities/var_dir.hpp"
#include "gtest/gtest.h"
#include <cstdio> // For std::remove
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <vector>

using namespace chunkforge;

// Helper function to read file contents
static std::string readFileContents(const std::string &path) {
    std::ifstream ifs(path);
    if (!ifs) {
        return "";
    }
    return std::string((std::istreambuf_iterator<char>(ifs)),
                       std::istreambuf_iterator<char>());
}

// Helper function to count occurrences of a substring
static int countOccurrences(const std::string &text, const std::string &sub) {
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
    std::vector<std::string> files_to_remove_;

    std::string logPath(const std::string &name) {
        std::string path = logsDir() + "/" + name;
        files_to_remove_.push_back(path);
        std::remove(path.c_str());
        return path;
    }

    void TearDown() override {
        // Point the singleton back at the suite log so file handles on the
        // test logs are released before they are removed.
        Logger::init(logsDir() + "/chunkforge_tests.log", LogLevel::DEBUG);
        for (const auto &file : files_to_remove_) {
            std::remove(file.c_str());
        }
        files_to_remove_.clear();
    }
};

TEST_F(LoggerTest, LogLevelFiltering) {
    const std::string testLogFile = logPath("test_level_filter.log");

    ASSERT_NO_THROW(Logger::init(testLogFile, LogLevel::INFO));
    Logger &logger = Logger::getInstance();

    logger.log(LogLevel::TRACE, "This is a trace message."); // Should not appear
    logger.log(LogLevel::DEBUG, "This is a debug message."); // Should not appear
    logger.log(LogLevel::INFO, "This is an info message.");
    logger.log(LogLevel::WARN, "This is a warning message.");
    logger.log(LogLevel::ERROR, "This is an error message.");

    std::string logContents = readFileContents(testLogFile);
    ASSERT_NE(logContents, "");

    EXPECT_EQ(countOccurrences(logContents, "This is a trace message."), 0);
    EXPECT_EQ(countOccurrences(logContents, "This is a debug message."), 0);
    EXPECT_NE(logContents.find("This is an info message."), std::string::npos);
    EXPECT_NE(logContents.find("This is a warning message."), std::string::npos);
    EXPECT_NE(logContents.find("This is an error message."), std::string::npos);
}

TEST_F(LoggerTest, JsonOutputFormat) {
    const std::string testLogFile = logPath("test_json_format.log");

    ASSERT_NO_THROW(Logger::init(testLogFile, LogLevel::DEBUG));
    Logger::getInstance().log(LogLevel::INFO,
                              "Chunk 0-a stored \"quoted\" \\ \n tab\t");

    std::string logContents = readFileContents(testLogFile);
    ASSERT_FALSE(logContents.empty());

    // One JSON object per line.
    std::istringstream lines(logContents);
    std::string line;
    ASSERT_TRUE(std::getline(lines, line));
    auto parsed = nlohmann::json::parse(line, nullptr, false);
    ASSERT_FALSE(parsed.is_discarded()) << line;
    EXPECT_EQ(parsed["level"], "INFO");
    EXPECT_EQ(parsed["message"], "Chunk 0-a stored \"quoted\" \\ \n tab\t");
    EXPECT_TRUE(parsed["timestamp"].is_string());
    EXPECT_NE(line.find("\"level\":\"INFO\""), std::string::npos);
}

TEST_F(LoggerTest, InvalidUtf8IsReplaced) {
    const std::string testLogFile = logPath("test_invalid_utf8.log");

    ASSERT_NO_THROW(Logger::init(testLogFile, LogLevel::DEBUG));
    EXPECT_NO_THROW(Logger::getInstance().log(LogLevel::WARN,
                                              std::string("bad \xff name")));
    std::string logContents = readFileContents(testLogFile);
    EXPECT_NE(logContents.find("bad "), std::string::npos);
}

TEST_F(LoggerTest, LogRotation) {
    const std::string baseLogFile = logPath("test_rotation.log");
    const int maxBackupFiles = 2;
    const long long maxFileSize = 1024; // 1KB
    for (int i = 1; i <= maxBackupFiles + 1; ++i) {
        logPath("test_rotation.log." + std::to_string(i));
    }

    ASSERT_NO_THROW(
        Logger::init(baseLogFile, LogLevel::DEBUG, maxFileSize, maxBackupFiles));
    Logger &logger = Logger::getInstance();

    std::string singleMessage = "Rotation test message. This message is "
                                "intended to fill the log file quickly. ";
    for (int k = 0; k < 3; ++k)
        singleMessage += singleMessage; // ~800 bytes

    // Two lines exceed the limit, so six lines fill three files.
    for (int i = 0; i < 6; ++i) {
        logger.log(LogLevel::INFO, singleMessage + " #" + std::to_string(i));
    }
    Logger::init(logsDir() + "/chunkforge_tests.log", LogLevel::DEBUG);

    EXPECT_TRUE(std::ifstream(baseLogFile).good());
    EXPECT_TRUE(std::ifstream(baseLogFile + ".1").good());
    EXPECT_TRUE(std::ifstream(baseLogFile + ".2").good());
    // This file should NOT exist as maxBackupFiles is 2
    EXPECT_FALSE(std::ifstream(baseLogFile + ".3").good());
}

TEST_F(LoggerTest, LogRotationNoBackups) {
    const std::string baseLogFile = logPath("test_no_backup_rotation.log");
    logPath("test_no_backup_rotation.log.1");

    ASSERT_NO_THROW(Logger::init(baseLogFile, LogLevel::DEBUG, 512, 0));
    Logger &logger = Logger::getInstance();

    std::string singleMessage =
        "No backup rotation test. This message is intended to be long. ";
    for (int k = 0; k < 2; ++k)
        singleMessage += singleMessage;
    for (int i = 0; i < 5; ++i) {
        logger.log(LogLevel::INFO, singleMessage + " #" + std::to_string(i));
    }
    Logger::init(logsDir() + "/chunkforge_tests.log", LogLevel::DEBUG);

    EXPECT_TRUE(std::ifstream(baseLogFile).good());
    EXPECT_FALSE(std::ifstream(baseLogFile + ".1").good());
}

// Re-initialization switches the destination and level.
TEST_F(LoggerTest, ReinitializationTest) {
    const std::string logFile1 = logPath("test_reinit1.log");
    const std::string logFile2 = logPath("test_reinit2.log");

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

TEST(LogLevelParsing, AcceptsNamesInAnyCase) {
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parseLogLevel("WARN"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("Warning"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("fatal"), LogLevel::FATAL);
    EXPECT_THROW(parseLogLevel("verbose"), std::invalid_argument);
}

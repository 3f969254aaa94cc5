#include "distd/errors.hpp"
#include "distd/logger.h"
#include "distd/var_dir.hpp"
#include "gtest/gtest.h"
#include <nlohmann/json.hpp>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

// Helper function to read file contents
static std::string readFileContents(const std::string &path) {
  std::ifstream ifs(path);
  if (!ifs) {
    return "";
  }
  return std::string((std::istreambuf_iterator<char>(ifs)),
                     std::istreambuf_iterator<char>());
}

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

  void TearDown() override {
    // Hand the singleton back to the suite-wide log file.
    Logger::init(distd::logsDir() + "/distd_tests.log", LogLevel::DEBUG);
    for (const auto &file : files_to_remove_) {
      std::remove(file.c_str());
    }
    files_to_remove_.clear();
  }

  std::string logPath(const std::string &name) {
    std::string path = distd::logsDir() + "/" + name;
    files_to_remove_.push_back(path);
    for (int i = 1; i <= 3; ++i)
      files_to_remove_.push_back(path + "." + std::to_string(i));
    for (const auto &f : files_to_remove_)
      std::remove(f.c_str());
    return path;
  }
};

TEST_F(LoggerTest, LogLevelFiltering) {
  const std::string testLogFile = logPath("test_level_filter.log");

  ASSERT_NO_THROW(Logger::init(testLogFile, LogLevel::INFO));
  Logger &logger = Logger::getInstance();

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

TEST_F(LoggerTest, LineFormat) {
  const std::string testLogFile = logPath("test_line_format.log");
  ASSERT_NO_THROW(Logger::init(testLogFile, LogLevel::DEBUG));
  Logger::getInstance().log(LogLevel::WARN, "formatted line");

  std::string line = readFileContents(testLogFile);
  ASSERT_FALSE(line.empty());
  EXPECT_EQ(line.back(), '\n');
  nlohmann::json entry = nlohmann::json::parse(line);
  EXPECT_EQ(entry.size(), 3u);
  EXPECT_EQ(entry["level"], "WARN");
  EXPECT_EQ(entry["message"], "formatted line");
  // YYYY-mm-dd HH:MM:SS.mmm
  EXPECT_EQ(entry["timestamp"].get<std::string>().size(), 23u);
}

TEST_F(LoggerTest, InvalidUtf8IsReplaced) {
  const std::string testLogFile = logPath("test_utf8.log");
  ASSERT_NO_THROW(Logger::init(testLogFile, LogLevel::DEBUG));
  ASSERT_NO_THROW(Logger::getInstance().log(LogLevel::INFO, "path \xff\xfe"));
  nlohmann::json entry = nlohmann::json::parse(readFileContents(testLogFile));
  EXPECT_EQ(entry["message"].get<std::string>().rfind("path ", 0), 0u);
}

TEST_F(LoggerTest, PrintfHelpers) {
  const std::string testLogFile = logPath("test_printf.log");
  ASSERT_NO_THROW(Logger::init(testLogFile, LogLevel::TRACE));
  Logger::trace("chunk %d of %s", 3, "item");
  Logger::debugf("%zu bytes", static_cast<size_t>(42));
  std::string contents = readFileContents(testLogFile);
  EXPECT_NE(contents.find(R"({"level":"TRACE","message":"chunk 3 of item")"),
            std::string::npos);
  EXPECT_NE(contents.find(R"({"level":"DEBUG","message":"42 bytes")"),
            std::string::npos);
}

TEST_F(LoggerTest, LogRotation) {
  const std::string baseLogFile = logPath("test_rotation.log");
  const int maxBackupFiles = 2;
  const long long maxFileSize = 1024;

  ASSERT_NO_THROW(
      Logger::init(baseLogFile, LogLevel::DEBUG, maxFileSize, maxBackupFiles));
  Logger &logger = Logger::getInstance();

  std::string singleMessage = "Rotation test message, long enough to fill "
                              "the log file after a handful of lines. ";
  for (int k = 0; k < 3; ++k)
    singleMessage += singleMessage;

  // Two lines fill a file, six lines need the base file and two backups.
  for (int i = 0; i < 6; ++i) {
    logger.log(LogLevel::INFO, singleMessage + " #" + std::to_string(i));
  }

  EXPECT_TRUE(std::ifstream(baseLogFile).good());
  EXPECT_TRUE(std::ifstream(baseLogFile + ".1").good());
  EXPECT_TRUE(std::ifstream(baseLogFile + ".2").good());
  EXPECT_FALSE(std::ifstream(baseLogFile + ".3").good());
  EXPECT_NE(readFileContents(baseLogFile).find(" #5"), std::string::npos);
}

TEST_F(LoggerTest, LogRotationNoBackups) {
  const std::string baseLogFile = logPath("test_no_backup_rotation.log");

  ASSERT_NO_THROW(Logger::init(baseLogFile, LogLevel::DEBUG, 512, 0));
  Logger &logger = Logger::getInstance();

  std::string singleMessage =
      "No backup rotation test. This message is intended to be somewhat long. ";
  for (int k = 0; k < 2; ++k)
    singleMessage += singleMessage;
  for (int i = 0; i < 5; ++i) {
    logger.log(LogLevel::INFO, singleMessage + " #" + std::to_string(i));
  }

  EXPECT_TRUE(std::ifstream(baseLogFile).good());
  EXPECT_FALSE(std::ifstream(baseLogFile + ".1").good());
}

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
}

TEST_F(LoggerTest, ConcurrentWritersKeepLinesWhole) {
  const std::string testLogFile = logPath("test_concurrent.log");
  ASSERT_NO_THROW(Logger::init(testLogFile, LogLevel::DEBUG));

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([t] {
      for (int i = 0; i < 50; ++i)
        Logger::getInstance().log(LogLevel::INFO,
                                  "writer " + std::to_string(t) + " line");
    });
  }
  for (auto &th : threads)
    th.join();

  std::string contents = readFileContents(testLogFile);
  std::istringstream lines(contents);
  std::string line;
  int parsed = 0;
  while (std::getline(lines, line)) {
    nlohmann::json entry = nlohmann::json::parse(line);
    EXPECT_EQ(entry["level"], "INFO");
    ++parsed;
  }
  EXPECT_EQ(parsed, 200);
}

TEST(LogLevelTest, ParseLogLevel) {
  EXPECT_EQ(parseLogLevel("trace"), LogLevel::TRACE);
  EXPECT_EQ(parseLogLevel("Info"), LogLevel::INFO);
  EXPECT_EQ(parseLogLevel("WARNING"), LogLevel::WARN);
  EXPECT_EQ(parseLogLevel("error"), LogLevel::ERROR);
  EXPECT_THROW(parseLogLevel("loud"), distd::InvalidInputError);
}

#pragma once
#ifndef DISTD_LOGGER_H
#define DISTD_LOGGER_H
#include <fstream>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>

enum LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

/**
 * @brief Parse a level name ("trace", "INFO", ...), case-insensitive.
 * @throws distd::InvalidInputError on an unknown name.
 */
LogLevel parseLogLevel(const std::string &name);

class Logger {
public:
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  static const std::string CONSOLE_ONLY_OUTPUT; // log to stderr only

  static void init(const std::string &logFile, LogLevel level = LogLevel::INFO,
                   long long maxFileSize = 10 * 1024 * 1024,
                   int maxBackupFiles = 5);
  static Logger &getInstance();

  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;
  void log(LogLevel level, const std::string &message);
  const std::string &getLogFilePath() const { return logFilePath; }

  /**
   * @brief printf-style convenience wrapper logging at TRACE level.
   */
  static void trace(const char *format, ...);
  /** @brief printf-style convenience wrapper logging at DEBUG level. */
  static void debugf(const char *format, ...);

  ~Logger();

private:
  Logger(const std::string &logFile, LogLevel level, long long maxFileSizeVal,
         int maxBackupFilesVal);

  std::string getTimestamp();
  static std::string levelToString(LogLevel level);
  void rotateIfNeeded();

  std::ofstream logFileStream;
  LogLevel currentLogLevel;
  std::string logFilePath;
  long long maxFileSize;
  int maxBackupFiles;

  static Logger *s_instance;
  static std::recursive_mutex s_mutex;
};

#endif // DISTD_LOGGER_H

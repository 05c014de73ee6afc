#pragma once
#ifndef CHUNKFORGE_LOGGER_H
#define CHUNKFORGE_LOGGER_H
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>     // For std::mutex and std::lock_guard
#include <stdexcept> // Required for std::runtime_error
#include <string>

namespace chunkforge {

enum LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

/**
 * @brief Parse a level name such as "info" or "WARN".
 * @throw std::invalid_argument If the name is not a known level.
 */
LogLevel parseLogLevel(const std::string &name);

class Logger {
public:
  // Deleting copy constructor and assignment operator
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  static const std::string
      CONSOLE_ONLY_OUTPUT; // Special value for console-only logging

  static void init(const std::string &logFile, LogLevel level = LogLevel::INFO,
                   long long maxFileSize = 10 * 1024 * 1024,
                   int maxBackupFiles = 5);
  static Logger &getInstance();

  void log(LogLevel level, const std::string &message);

  ~Logger();

private:
  Logger(const std::string &logFile, LogLevel level, long long maxFileSizeVal,
         int maxBackupFilesVal);

  std::string formatLine(LogLevel level, const std::string &message);
  void rotateIfNeeded();
  std::string getTimestamp();
  std::string levelToString(LogLevel level);

  std::ofstream logFileStream;
  LogLevel currentLogLevel;
  std::string logFilePath;
  long long maxFileSize;
  int maxBackupFiles;

  static Logger *s_instance;
  static std::mutex s_mutex; // Mutex for thread safety
};

} // namespace chunkforge

#endif // CHUNKFORGE_LOGGER_H

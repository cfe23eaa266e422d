#pragma once
#ifndef MAILCAS_LOGGER_H
#define MAILCAS_LOGGER_H
#include <fstream>
#include <mutex> // For std::mutex and std::lock_guard
#include <string>

namespace mailcas {

enum LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

/**
 * @brief Parse a level name ("trace", "debug", "info", "warn", "error",
 * "fatal"), case-insensitive.
 * @throws std::invalid_argument for an unknown name.
 */
LogLevel logLevelFromString(const std::string &name);

/**
 * @brief Process-wide JSON-lines logger with size based rotation.
 *
 * Each line is an object with "timestamp", "level" and "message" keys. When
 * the active file grows past maxFileSize it is renamed to `<file>.1`, older
 * backups shift up by one and anything past maxBackupFiles is dropped.
 */
class Logger {
public:
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  static const std::string CONSOLE_ONLY_OUTPUT; // Special value for console-only logging

  static void init(const std::string &logFile, LogLevel level = LogLevel::INFO,
                   long long maxFileSize = 10 * 1024 * 1024,
                   int maxBackupFiles = 5);
  static Logger &getInstance();

  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;
  void log(LogLevel level, const std::string &message);
  void logToConsole(LogLevel level, const std::string &message);
  /**
   * @brief Convenience wrapper for TRACE level logging.
   *
   * Formats the provided printf-style string and logs it at TRACE level.
   *
   * @param format printf-style format string.
   * @param ...    Format arguments.
   */
  static void trace(const char *format, ...);

  ~Logger();

private:
  Logger(const std::string &logFile, LogLevel level, long long maxFileSizeVal,
         int maxBackupFilesVal);

  std::string getTimestamp();
  std::string levelToString(LogLevel level);
  std::string formatLine(LogLevel level, const std::string &message);
  void rotateIfNeeded();

  std::ofstream logFileStream;
  LogLevel currentLogLevel;
  std::string logFilePath;
  long long maxFileSize;
  int maxBackupFiles;

  static Logger *s_instance;
  static std::mutex s_mutex;
};

} // namespace mailcas

#endif

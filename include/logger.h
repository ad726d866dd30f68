#ifndef LOGGER_H
#define LOGGER_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

// Severity, lowest first. DEBUG only reaches the console; INFO and above are
// also kept in the ring buffer served at GET /logs.
enum LogLevel {
  LOG_LEVEL_DEBUG = 0,
  LOG_LEVEL_INFO = 1,
  LOG_LEVEL_WARN = 2,
  LOG_LEVEL_ERROR = 3
};

struct LogEntry {
  uint32_t timestamp;  // Clock value when logged
  LogLevel level;
  std::string message;
};

// Shared by the supervisor task, the NimBLE host task and the web task, so
// every public call takes the internal lock.
class Logger {
public:
  using Clock = std::function<uint32_t()>;
  using Sink = std::function<void(const char* line)>;  // One "\n"-terminated line

  Logger();

  // Ring buffer capacity
  void begin(size_t maxEntries);

  // Firmware: millis() and Serial. Host default: steady clock and stdout.
  void setClock(Clock clock);
  void setSink(Sink sink);

  // Messages below this level are dropped entirely
  void setMinLevel(LogLevel level);

  void debug(const char* message);
  void debug(const std::string& message);
  void info(const char* message);
  void info(const std::string& message);
  void warn(const char* message);
  void warn(const std::string& message);
  void error(const char* message);
  void error(const std::string& message);

  // printf formatting, truncated to 255 characters
  void debugf(const char* format, ...);
  void infof(const char* format, ...);
  void warnf(const char* format, ...);
  void errorf(const char* format, ...);

  // Oldest first
  std::vector<LogEntry> getEntries() const;

  // [{"timestamp":"H:MM:SS.mmm","level":"INFO ","message":"..."}, ...]
  std::string getEntriesJSON() const;

  void clear();

private:
  mutable std::mutex mutex;
  std::vector<LogEntry> entries;
  size_t maxEntries;
  LogLevel minLevel;
  Clock clock;
  Sink sink;

  void log(LogLevel level, const std::string& message);
  std::string formatTimestamp(uint32_t millis) const;
  const char* getLevelName(LogLevel level) const;
};

extern Logger logger;

#define LOG_DEBUG(msg) logger.debug(msg)
#define LOG_INFO(msg) logger.info(msg)
#define LOG_WARN(msg) logger.warn(msg)
#define LOG_ERROR(msg) logger.error(msg)

#define LOG_DEBUGF(...) logger.debugf(__VA_ARGS__)
#define LOG_INFOF(...) logger.infof(__VA_ARGS__)
#define LOG_WARNF(...) logger.warnf(__VA_ARGS__)
#define LOG_ERRORF(...) logger.errorf(__VA_ARGS__)

#endif // LOGGER_H

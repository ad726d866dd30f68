#include "logger.h"
#include "config.h"
#include <ArduinoJson.h>
#include <chrono>
#include <cstdarg>
#include <cstdio>

Logger logger;

static uint32_t steadyMillis() {
  static const auto start = std::chrono::steady_clock::now();
  auto elapsed = std::chrono::steady_clock::now() - start;
  return static_cast<uint32_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
}

static std::string formatMessage(const char* format, va_list args) {
  char buffer[256];
  vsnprintf(buffer, sizeof(buffer), format, args);
  return std::string(buffer);
}

Logger::Logger()
    : maxEntries(LOG_BUFFER_SIZE),
      minLevel(LOG_LEVEL_DEBUG),
      clock(steadyMillis),
      sink([](const char* line) { fputs(line, stdout); }) {}

void Logger::begin(size_t maxEntries) {
  std::lock_guard<std::mutex> lock(mutex);
  this->maxEntries = maxEntries;
  entries.reserve(maxEntries);
}

void Logger::setClock(Clock clock) {
  std::lock_guard<std::mutex> lock(mutex);
  this->clock = clock ? clock : Clock(steadyMillis);
}

void Logger::setSink(Sink sink) {
  std::lock_guard<std::mutex> lock(mutex);
  this->sink = sink;
}

void Logger::setMinLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex);
  minLevel = level;
}

void Logger::log(LogLevel level, const std::string& message) {
  std::lock_guard<std::mutex> lock(mutex);
  if (level < minLevel) {
    return;
  }

  uint32_t now = clock();
  std::string timestamp = formatTimestamp(now);

  if (sink) {
    char line[320];
    snprintf(line, sizeof(line), "[%s] %s: %s\n", timestamp.c_str(), getLevelName(level), message.c_str());
    sink(line);
  }

  if (level >= LOG_LEVEL_INFO && maxEntries > 0) {
    LogEntry entry;
    entry.timestamp = now;
    entry.level = level;
    entry.message = message;

    if (entries.size() >= maxEntries) {
      entries.erase(entries.begin());
    }
    entries.push_back(entry);
  }
}

std::string Logger::formatTimestamp(uint32_t millis) const {
  unsigned long totalSeconds = millis / 1000;
  unsigned long ms = millis % 1000;
  unsigned long seconds = totalSeconds % 60;
  unsigned long minutes = (totalSeconds / 60) % 60;
  unsigned long hours = totalSeconds / 3600;

  char buffer[24];
  snprintf(buffer, sizeof(buffer), "%lu:%02lu:%02lu.%03lu", hours, minutes, seconds, ms);
  return std::string(buffer);
}

const char* Logger::getLevelName(LogLevel level) const {
  switch (level) {
    case LOG_LEVEL_DEBUG: return "DEBUG";
    case LOG_LEVEL_INFO:  return "INFO ";
    case LOG_LEVEL_WARN:  return "WARN ";
    case LOG_LEVEL_ERROR: return "ERROR";
    default:              return "?????";
  }
}

void Logger::debug(const char* message) {
  log(LOG_LEVEL_DEBUG, std::string(message));
}

void Logger::debug(const std::string& message) {
  log(LOG_LEVEL_DEBUG, message);
}

void Logger::info(const char* message) {
  log(LOG_LEVEL_INFO, std::string(message));
}

void Logger::info(const std::string& message) {
  log(LOG_LEVEL_INFO, message);
}

void Logger::warn(const char* message) {
  log(LOG_LEVEL_WARN, std::string(message));
}

void Logger::warn(const std::string& message) {
  log(LOG_LEVEL_WARN, message);
}

void Logger::error(const char* message) {
  log(LOG_LEVEL_ERROR, std::string(message));
}

void Logger::error(const std::string& message) {
  log(LOG_LEVEL_ERROR, message);
}

void Logger::debugf(const char* format, ...) {
  va_list args;
  va_start(args, format);
  std::string message = formatMessage(format, args);
  va_end(args);
  log(LOG_LEVEL_DEBUG, message);
}

void Logger::infof(const char* format, ...) {
  va_list args;
  va_start(args, format);
  std::string message = formatMessage(format, args);
  va_end(args);
  log(LOG_LEVEL_INFO, message);
}

void Logger::warnf(const char* format, ...) {
  va_list args;
  va_start(args, format);
  std::string message = formatMessage(format, args);
  va_end(args);
  log(LOG_LEVEL_WARN, message);
}

void Logger::errorf(const char* format, ...) {
  va_list args;
  va_start(args, format);
  std::string message = formatMessage(format, args);
  va_end(args);
  log(LOG_LEVEL_ERROR, message);
}

std::vector<LogEntry> Logger::getEntries() const {
  std::lock_guard<std::mutex> lock(mutex);
  return entries;
}

std::string Logger::getEntriesJSON() const {
  std::vector<LogEntry> snapshot = getEntries();

  // Strings are copied into the document, reserve room for them
  size_t capacity = JSON_ARRAY_SIZE(snapshot.size()) + snapshot.size() * JSON_OBJECT_SIZE(3) + 64;
  for (const LogEntry& entry : snapshot) {
    capacity += entry.message.size() + 32;
  }
  DynamicJsonDocument doc(capacity);
  JsonArray array = doc.to<JsonArray>();

  for (const LogEntry& entry : snapshot) {
    JsonObject o = array.createNestedObject();
    o["timestamp"] = formatTimestamp(entry.timestamp);
    o["level"] = getLevelName(entry.level);
    o["message"] = entry.message;
  }

  std::string json;
  serializeJson(doc, json);
  return json;
}

void Logger::clear() {
  std::lock_guard<std::mutex> lock(mutex);
  entries.clear();
}

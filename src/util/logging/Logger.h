#pragma once

#include "LogSink.h"
#include <atomic>
#include <chrono>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>
#include <vector>

namespace Feedwise {
namespace Util {

/**
 * Logger - Process-wide log router
 *
 * Entries below the minimum level are dropped; the rest are stamped and
 * handed to every sink under one mutex, so lines written by save workers
 * and the caller's thread never interleave. EngineConfig::applyLogging()
 * installs the sinks; with none installed, logging is a no-op.
 *
 *   logWarning("PreferenceRegistry", "Save failed, keeping in-memory state", "profile=default");
 */
class Logger {
public:
  static Logger &getInstance() {
    static Logger instance;
    return instance;
  }

  void addSink(std::unique_ptr<LogSink> sink) {
    if (!sink)
      return;

    std::lock_guard<std::mutex> lock(sinkMutex);
    sinks.push_back(std::move(sink));
  }

  void clearSinks() {
    std::lock_guard<std::mutex> lock(sinkMutex);
    sinks.clear();
  }

  void setMinLevel(LogLevel level) {
    minLevel = level;
  }

  void log(LogLevel level, const juce::String &category, const juce::String &message,
           const juce::String &context = "") {
    if (level < minLevel.load())
      return;

    LogEntry entry;
    entry.level = level;
    entry.category = category;
    entry.message = message;
    entry.context = context;
    entry.timestamp = makeTimestamp();

    std::lock_guard<std::mutex> lock(sinkMutex);
    for (auto &sink : sinks)
      sink->write(entry);
  }

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

private:
  Logger() = default;

  std::vector<std::unique_ptr<LogSink>> sinks;
  std::mutex sinkMutex;
  std::atomic<LogLevel> minLevel{LogLevel::Debug};

  // Local time, millisecond precision: 2024-05-01T13:45:07.123
  static juce::String makeTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis.count();
    return juce::String(out.str());
  }
};

inline void logDebug(const juce::String &category, const juce::String &message, const juce::String &context = "") {
  Logger::getInstance().log(LogLevel::Debug, category, message, context);
}

inline void logInfo(const juce::String &category, const juce::String &message, const juce::String &context = "") {
  Logger::getInstance().log(LogLevel::Info, category, message, context);
}

inline void logWarning(const juce::String &category, const juce::String &message, const juce::String &context = "") {
  Logger::getInstance().log(LogLevel::Warning, category, message, context);
}

inline void logError(const juce::String &category, const juce::String &message, const juce::String &context = "") {
  Logger::getInstance().log(LogLevel::Error, category, message, context);
}

} // namespace Util
} // namespace Feedwise

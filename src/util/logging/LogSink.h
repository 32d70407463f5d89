#pragma once

#include <JuceHeader.h>
#include <iostream>
#include <memory>

namespace Feedwise {
namespace Util {

enum class LogLevel { Debug = 0, Info = 1, Warning = 2, Error = 3 };

struct LogEntry {
  LogLevel level = LogLevel::Info;
  juce::String category;  // component that logged, e.g. "PreferenceStore"
  juce::String message;
  juce::String context;   // key=value details: profile=..., topic=..., path=...
  juce::String timestamp;
};

/**
 * LogSink - Destination for formatted log lines
 *
 * Every sink renders the same line:
 *   [2024-05-01T13:45:07.123] [WARN] [PreferenceRegistry] Save failed (profile=default)
 */
class LogSink {
public:
  virtual ~LogSink() = default;

  virtual void write(const LogEntry &entry) = 0;

  static juce::String levelToString(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:
      return "DEBUG";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warning:
      return "WARN";
    case LogLevel::Error:
      return "ERROR";
    }
    return "UNKNOWN";
  }

  static juce::String formatEntry(const LogEntry &entry) {
    juce::String line;
    line << "[" << entry.timestamp << "] [" << levelToString(entry.level) << "] [" << entry.category << "] "
         << entry.message;

    if (entry.context.isNotEmpty())
      line << " (" << entry.context << ")";
    return line;
  }
};

/**
 * ConsoleSink - Terminal output, optionally ANSI coloured by level
 *
 * Warnings and errors go to stderr so command output on stdout stays clean.
 */
class ConsoleSink : public LogSink {
public:
  explicit ConsoleSink(bool useColours = true) : colours(useColours) {}

  void write(const LogEntry &entry) override {
    auto line = formatEntry(entry);
    if (colours)
      line = colourFor(entry.level) + line + "\033[0m";

    auto &stream = entry.level >= LogLevel::Warning ? std::cerr : std::cout;
    stream << line.toStdString() << std::endl;
  }

private:
  bool colours;

  static const char *colourFor(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:
      return "\033[36m";
    case LogLevel::Info:
      return "\033[32m";
    case LogLevel::Warning:
      return "\033[33m";
    case LogLevel::Error:
      return "\033[31m";
    }
    return "\033[0m";
  }
};

/**
 * FileSink - Appends to a log file and rotates it by size
 *
 * feedwise.log -> feedwise.log.1 -> ... -> feedwise.log.<maxBackups>
 * A relative path is resolved against the working directory.
 */
class FileSink : public LogSink {
public:
  explicit FileSink(const juce::String &path, juce::int64 maxSizeKB = 10240, int maxBackups = 5)
      : logFile(juce::File::getCurrentWorkingDirectory().getChildFile(path)), maxBytes(maxSizeKB * 1024),
        maxBackupFiles(maxBackups) {
    open();
  }

  bool isOpen() const {
    return stream != nullptr;
  }

  void write(const LogEntry &entry) override {
    if (stream == nullptr)
      open();
    if (stream == nullptr)
      return;

    stream->writeText(formatEntry(entry) + "\n", false, false, nullptr);
    stream->flush();

    if (maxBytes > 0 && stream->getPosition() > maxBytes)
      rotate();
  }

private:
  juce::File logFile;
  juce::int64 maxBytes;
  int maxBackupFiles;
  std::unique_ptr<juce::FileOutputStream> stream;

  void open() {
    if (logFile.getParentDirectory().createDirectory().failed())
      return;

    auto opened = std::make_unique<juce::FileOutputStream>(logFile);
    if (opened->openedOk())
      stream = std::move(opened);
  }

  juce::File backup(int index) const {
    return logFile.getSiblingFile(logFile.getFileName() + "." + juce::String(index));
  }

  void rotate() {
    stream.reset();

    for (int i = maxBackupFiles - 1; i >= 1; --i) {
      if (backup(i).existsAsFile() && !backup(i).moveFileTo(backup(i + 1)))
        std::cerr << "FileSink: could not rotate " << backup(i).getFullPathName().toStdString() << std::endl;
    }

    if (maxBackupFiles > 0 && !logFile.moveFileTo(backup(1)))
      std::cerr << "FileSink: could not rotate " << logFile.getFullPathName().toStdString() << std::endl;

    open();
  }
};

} // namespace Util
} // namespace Feedwise

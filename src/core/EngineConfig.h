#pragma once

#include "../feed/ContentFilter.h"
#include "../util/Constants.h"
#include "../util/logging/LogSink.h"
#include <JuceHeader.h>
#include <optional>

namespace Feedwise {

// ==============================================================================
/**
 * EngineConfig - Engine settings read from the Feedwise PropertiesFile
 *
 * Keys (see Constants::Config):
 *   preferences.directory  store directory, default FilePreferenceStore::getDefaultDirectory()
 *   filter.boostUnit       positive double, default 1.0
 *   filter.matchMode       "word" or "substring"
 *   log.level              debug | info | warning | error
 *   log.file               optional log file path
 *   scheduler.threads      1..8, default 2
 *
 * Invalid values fall back to the default and log a warning; loading never
 * fails.
 */
struct EngineConfig {
  juce::File preferencesDirectory;
  ContentFilter::Config filter;
  Util::LogLevel logLevel = Util::LogLevel::Info;
  juce::String logFile;
  int schedulerThreads = Constants::Config::DEFAULT_SCHEDULER_THREADS;

  static EngineConfig defaults();

  static EngineConfig fromProperties(const juce::PropertySet &props);

  /** Read the standard settings file (PropertiesFileUtils options) */
  static EngineConfig load();

  /** Read a specific settings file, e.g. from --settings */
  static EngineConfig loadFrom(const juce::File &settingsFile);

  /** Set the Logger level and install a console sink plus the optional file sink */
  void applyLogging(bool consoleColours = true) const;

  static std::optional<Util::LogLevel> parseLogLevel(const juce::String &text);
};

} // namespace Feedwise

#include "EngineConfig.h"
#include "../stores/FilePreferenceStore.h"
#include "../util/PropertiesFileUtils.h"
#include "../util/logging/Logger.h"

namespace Feedwise {

namespace {
const juce::String kCategory = "Config";
}

std::optional<Util::LogLevel> EngineConfig::parseLogLevel(const juce::String &text) {
  auto level = text.trim().toLowerCase();
  if (level == "debug")
    return Util::LogLevel::Debug;
  if (level == "info")
    return Util::LogLevel::Info;
  if (level == "warning" || level == "warn")
    return Util::LogLevel::Warning;
  if (level == "error")
    return Util::LogLevel::Error;
  return std::nullopt;
}

EngineConfig EngineConfig::defaults() {
  EngineConfig config;
  config.preferencesDirectory = Stores::FilePreferenceStore::getDefaultDirectory();
  return config;
}

EngineConfig EngineConfig::fromProperties(const juce::PropertySet &props) {
  using namespace Constants::Config;
  auto config = defaults();

  auto directory = props.getValue(PREFERENCES_DIRECTORY).trim();
  if (directory.isNotEmpty())
    config.preferencesDirectory = juce::File::getCurrentWorkingDirectory().getChildFile(directory);

  if (props.containsKey(BOOST_UNIT)) {
    auto boost = props.getDoubleValue(BOOST_UNIT, Constants::Filter::DEFAULT_BOOST_UNIT);
    if (boost > 0.0)
      config.filter.boostUnit = boost;
    else
      Util::logWarning(kCategory, "Ignoring non-positive boost unit", juce::String(BOOST_UNIT) + "=" +
                                                                          props.getValue(BOOST_UNIT));
  }

  if (props.containsKey(MATCH_MODE)) {
    if (auto mode = parseMatchMode(props.getValue(MATCH_MODE)))
      config.filter.matchMode = *mode;
    else
      Util::logWarning(kCategory, "Unknown match mode, using word",
                       juce::String(MATCH_MODE) + "=" + props.getValue(MATCH_MODE));
  }

  if (props.containsKey(LOG_LEVEL)) {
    if (auto level = parseLogLevel(props.getValue(LOG_LEVEL)))
      config.logLevel = *level;
    else
      Util::logWarning(kCategory, "Unknown log level, using info",
                       juce::String(LOG_LEVEL) + "=" + props.getValue(LOG_LEVEL));
  }

  config.logFile = props.getValue(LOG_FILE).trim();

  if (props.containsKey(SCHEDULER_THREADS)) {
    auto threads = props.getIntValue(SCHEDULER_THREADS, DEFAULT_SCHEDULER_THREADS);
    if (threads >= 1 && threads <= MAX_SCHEDULER_THREADS)
      config.schedulerThreads = threads;
    else
      Util::logWarning(kCategory, "Scheduler threads out of range (1-8), using default",
                       juce::String(SCHEDULER_THREADS) + "=" + juce::String(threads));
  }

  return config;
}

EngineConfig EngineConfig::load() {
  juce::PropertiesFile props(Util::PropertiesFileUtils::getStandardOptions());
  Util::logDebug(kCategory, "Reading settings", "path=" + props.getFile().getFullPathName());
  return fromProperties(props);
}

EngineConfig EngineConfig::loadFrom(const juce::File &settingsFile) {
  if (!settingsFile.existsAsFile())
    Util::logWarning(kCategory, "Settings file not found, using defaults", "path=" + settingsFile.getFullPathName());

  juce::PropertiesFile props(settingsFile, Util::PropertiesFileUtils::getStandardOptions());
  return fromProperties(props);
}

void EngineConfig::applyLogging(bool consoleColours) const {
  auto &logger = Util::Logger::getInstance();
  logger.clearSinks();
  logger.setMinLevel(logLevel);
  logger.addSink(std::make_unique<Util::ConsoleSink>(consoleColours));

  if (logFile.isNotEmpty()) {
    auto sink = std::make_unique<Util::FileSink>(logFile);
    if (sink->isOpen())
      logger.addSink(std::move(sink));
    else
      Util::logWarning(kCategory, "Could not open log file", "path=" + logFile);
  }
}

} // namespace Feedwise

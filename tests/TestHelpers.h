#pragma once

#include "models/ContentItem.h"
#include "stores/PreferenceStore.h"
#include "util/logging/Logger.h"
#include <JuceHeader.h>
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace Feedwise {
namespace Testing {

//==============================================================================
/** Fresh directory under the system temp dir, removed on destruction */
class ScopedTempDirectory {
public:
  ScopedTempDirectory() {
    directory = juce::File::getSpecialLocation(juce::File::tempDirectory)
                    .getNonexistentChildFile("feedwise_test", "", false);
    directory.createDirectory();
  }

  ~ScopedTempDirectory() {
    directory.deleteRecursively();
  }

  const juce::File &get() const {
    return directory;
  }

private:
  juce::File directory;
};

//==============================================================================
/**
 * In-memory PreferenceStore with switches for failure paths.
 * saveDelayMs keeps a save in flight long enough to overlap with mutations.
 */
class MemoryPreferenceStore : public Stores::PreferenceStore {
public:
  Outcome<PreferenceSet> load(const juce::String &profileId) override {
    loadCount++;
    if (failLoads)
      return Outcome<PreferenceSet>::error(ErrorKind::StoreUnavailable, "load disabled");

    std::lock_guard<std::mutex> lock(mutex);
    auto it = profiles.find(profileId);
    return Outcome<PreferenceSet>::ok(it == profiles.end() ? PreferenceSet{} : it->second);
  }

  Outcome<void> save(const juce::String &profileId, const PreferenceSet &prefs) override {
    if (saveDelayMs > 0)
      std::this_thread::sleep_for(std::chrono::milliseconds(saveDelayMs.load()));

    saveCount++;
    if (throwSaves)
      throw std::runtime_error("store exploded");
    if (failSaves)
      return Outcome<void>::error(ErrorKind::StoreUnavailable, "disk full");

    std::lock_guard<std::mutex> lock(mutex);
    profiles[profileId] = prefs;
    return Outcome<void>::ok();
  }

  juce::String getName() const override {
    return "MemoryPreferenceStore";
  }

  PreferenceSet stored(const juce::String &profileId) {
    std::lock_guard<std::mutex> lock(mutex);
    return profiles[profileId];
  }

  void seed(const juce::String &profileId, const PreferenceSet &prefs) {
    std::lock_guard<std::mutex> lock(mutex);
    profiles[profileId] = prefs;
  }

  std::atomic<bool> failLoads{false};
  std::atomic<bool> failSaves{false};
  std::atomic<bool> throwSaves{false};
  std::atomic<int> saveDelayMs{0};
  std::atomic<int> saveCount{0};
  std::atomic<int> loadCount{0};

private:
  std::mutex mutex;
  std::map<juce::String, PreferenceSet> profiles;
};

//==============================================================================
/** Collects log entries while in scope */
class ScopedLogCapture {
public:
  ScopedLogCapture() : entries(std::make_shared<Shared>()) {
    Util::Logger::getInstance().addSink(std::make_unique<Sink>(entries));
  }

  ~ScopedLogCapture() {
    Util::Logger::getInstance().clearSinks();
  }

  bool contains(Util::LogLevel level, const juce::String &text) const {
    std::lock_guard<std::mutex> lock(entries->mutex);
    for (const auto &entry : entries->list) {
      if (entry.level == level && (entry.message.contains(text) || entry.context.contains(text)))
        return true;
    }
    return false;
  }

private:
  struct Shared {
    std::mutex mutex;
    std::vector<Util::LogEntry> list;
  };

  class Sink : public Util::LogSink {
  public:
    explicit Sink(std::shared_ptr<Shared> target) : shared(std::move(target)) {}

    void write(const Util::LogEntry &entry) override {
      std::lock_guard<std::mutex> lock(shared->mutex);
      shared->list.push_back(entry);
    }

  private:
    std::shared_ptr<Shared> shared;
  };

  std::shared_ptr<Shared> entries;
};

inline ContentItem makeItem(const juce::String &id, const juce::String &title, const juce::String &description = {},
                            const juce::StringArray &tags = {}) {
  ContentItem item;
  item.id = id;
  item.title = title;
  item.description = description;
  item.tags = tags;
  return item;
}

} // namespace Testing
} // namespace Feedwise

#pragma once

#include "../models/PreferenceSet.h"
#include "../util/Result.h"
#include "../util/TaskScheduler.h"
#include "../util/rx/StateSubject.h"
#include "PreferenceStore.h"
#include <JuceHeader.h>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <rxcpp/rx.hpp>

namespace Feedwise {
namespace Stores {

/**
 * PreferenceRegistry - Authoritative in-memory view of every profile's topics
 *
 * Each profile is loaded lazily from the PreferenceStore on first use and is
 * guarded by one exclusive writer lock. Mutations update memory, publish the
 * new snapshot to subscribers and return; the store write happens on the
 * TaskScheduler.
 *
 * Persistence policy:
 * - Saves for one profile run one at a time, in scheduling order
 * - A queued save that a newer one has superseded is skipped
 * - A failed save keeps the in-memory state and goes to the failure handler
 * - A failed initial load starts the profile empty; the next save replaces
 *   the unreadable file
 *
 * Usage:
 *   auto store = std::make_shared<FilePreferenceStore>();
 *   auto scheduler = std::make_shared<Util::TaskScheduler>(2);
 *   PreferenceRegistry registry(store, scheduler);
 *
 *   registry.addBlocked("default", "ASMR")
 *       .onError([](ErrorKind, const juce::String& msg) { showHint(msg); });
 *
 *   auto unsub = registry.subscribe("default", [](const PreferenceSet& p) { render(p); });
 *
 * Subscriber callbacks run on the mutating thread while its writer lock is
 * held; they must not mutate the same profile synchronously.
 */
class PreferenceRegistry {
public:
  using SaveFailureHandler = std::function<void(const juce::String &profileId, const juce::String &message)>;
  using SnapshotCallback = std::function<void(const PreferenceSet &)>;
  using Unsubscriber = std::function<void()>;

  PreferenceRegistry(std::shared_ptr<PreferenceStore> store, std::shared_ptr<Util::TaskScheduler> scheduler);

  /** Waits for scheduled saves before returning */
  ~PreferenceRegistry();

  //==========================================================================
  // Mutations (topic text is normalized before use)

  Outcome<PreferenceSet> addPreferred(const juce::String &profileId, const juce::String &topic);
  Outcome<PreferenceSet> removePreferred(const juce::String &profileId, const juce::String &topic);
  Outcome<PreferenceSet> addBlocked(const juce::String &profileId, const juce::String &topic);
  Outcome<PreferenceSet> removeBlocked(const juce::String &profileId, const juce::String &topic);

  /** Remove when preferred, add otherwise */
  Outcome<PreferenceSet> togglePreferred(const juce::String &profileId, const juce::String &topic);

  /**
   * Prefer every topic in one mutation and mark onboarding done.
   * Needs at least Constants::Onboarding::MIN_TOPICS distinct valid topics.
   */
  Outcome<PreferenceSet> completeOnboarding(const juce::String &profileId, const juce::StringArray &topics);

  //==========================================================================
  // Reads (copies; safe from any thread)

  Outcome<TopicSet> currentPreferred(const juce::String &profileId);
  Outcome<TopicSet> currentBlocked(const juce::String &profileId);
  Outcome<PreferenceSet> snapshot(const juce::String &profileId);

  /** Like snapshot(), but fails with the load error if stored data could not be read */
  Outcome<PreferenceSet> storedSnapshot(const juce::String &profileId);

  /** Number of mutations that changed the profile; 0 for unknown profiles */
  juce::uint64 version(const juce::String &profileId) const;

  //==========================================================================
  // Observation

  /** Called with the current snapshot now and after every change */
  Outcome<Unsubscriber> subscribe(const juce::String &profileId, SnapshotCallback callback);

  /** Emits the current snapshot, then every change */
  rxcpp::observable<PreferenceSet> observe(const juce::String &profileId);

  //==========================================================================
  // Lifecycle

  /** Load now instead of on first use. Reports the load failure, if any. */
  Outcome<void> loadProfile(const juce::String &profileId);

  /**
   * Receives (profileId, message) for every persistence failure: failed
   * saves and failed initial loads. Called from the failing thread.
   */
  void setSaveFailureHandler(SaveFailureHandler handler);

  /**
   * Block until every scheduled save has finished
   * @param timeoutMs 0 waits indefinitely
   * @return false on timeout
   */
  bool flush(int timeoutMs = 0);

  juce::StringArray getLoadedProfiles() const;

private:
  struct ProfileSlot {
    explicit ProfileSlot(const juce::String &id) : profileId(id) {}

    const juce::String profileId;

    std::once_flag loadFlag;
    Outcome<void> loadResult = Outcome<void>::ok();

    std::mutex writeMutex;
    Rx::StateSubject<PreferenceSet> state;
    std::atomic<juce::uint64> version{0};

    std::mutex saveMutex;
    std::atomic<juce::uint64> scheduledGeneration{0};
  };

  using Mutation = std::function<bool(PreferenceSet &)>;

  Outcome<std::shared_ptr<ProfileSlot>> getSlot(const juce::String &profileId);
  Outcome<PreferenceSet> mutate(const juce::String &profileId, const juce::String &action, const Mutation &mutation);
  Outcome<PreferenceSet> mutateTopic(const juce::String &profileId, const juce::String &rawTopic,
                                     const juce::String &action,
                                     std::function<bool(PreferenceSet &, const Topic &)> mutation);

  void scheduleSave(const std::shared_ptr<ProfileSlot> &slot, const PreferenceSet &snapshot, juce::uint64 generation);
  void runSave(ProfileSlot &slot, const PreferenceSet &snapshot, juce::uint64 generation);
  void finishSave();

  // Balances the pendingSaves increment however the save task exits
  struct PendingSaveGuard {
    explicit PendingSaveGuard(PreferenceRegistry &r) : registry(r) {}
    ~PendingSaveGuard() {
      registry.finishSave();
    }
    PreferenceRegistry &registry;
    JUCE_DECLARE_NON_COPYABLE(PendingSaveGuard)
  };
  void reportFailure(const juce::String &profileId, const juce::String &message);

  std::shared_ptr<PreferenceStore> store;
  std::shared_ptr<Util::TaskScheduler> scheduler;

  std::map<juce::String, std::shared_ptr<ProfileSlot>> slots;
  mutable std::mutex slotsMutex;

  SaveFailureHandler failureHandler;
  std::mutex handlerMutex;

  int pendingSaves = 0; // guarded by pendingMutex
  std::mutex pendingMutex;
  std::condition_variable pendingCondition;

  JUCE_DECLARE_NON_COPYABLE(PreferenceRegistry)
};

} // namespace Stores
} // namespace Feedwise

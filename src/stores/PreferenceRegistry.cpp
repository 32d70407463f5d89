#include "PreferenceRegistry.h"
#include "../util/Constants.h"
#include "../util/logging/Logger.h"

namespace Feedwise {
namespace Stores {

namespace {
const juce::String kCategory = "PreferenceRegistry";
}

PreferenceRegistry::PreferenceRegistry(std::shared_ptr<PreferenceStore> preferenceStore,
                                       std::shared_ptr<Util::TaskScheduler> taskScheduler)
    : store(std::move(preferenceStore)), scheduler(std::move(taskScheduler)) {
  Util::logDebug(kCategory, "Created", "store=" + (store ? store->getName() : juce::String("none")));
}

PreferenceRegistry::~PreferenceRegistry() {
  flush();
}

//==============================================================================
// Profile slots

Outcome<std::shared_ptr<PreferenceRegistry::ProfileSlot>>
PreferenceRegistry::getSlot(const juce::String &profileId) {
  using Result = Outcome<std::shared_ptr<ProfileSlot>>;

  if (profileId.trim().isEmpty())
    return Result::error(ErrorKind::InvalidProfile, Constants::Errors::EMPTY_PROFILE);

  std::shared_ptr<ProfileSlot> slot;
  {
    std::lock_guard<std::mutex> lock(slotsMutex);
    auto &entry = slots[profileId];
    if (!entry)
      entry = std::make_shared<ProfileSlot>(profileId);
    slot = entry;
  }

  // Loading happens outside slotsMutex so a slow store only blocks this profile
  std::call_once(slot->loadFlag, [this, &slot]() {
    auto loaded = store->load(slot->profileId);
    if (loaded.isOk()) {
      slot->state.next(loaded.getValue());
      Util::logInfo(kCategory, "Loaded profile",
                    "profile=" + slot->profileId + " preferred=" + describeTopics(loaded.getValue().preferred) +
                        " blocked=" + describeTopics(loaded.getValue().blocked));
      return;
    }

    slot->loadResult = Outcome<void>::error(loaded.getErrorKind(), loaded.getError());
    Util::logWarning(kCategory, "Load failed, starting profile empty",
                     "profile=" + slot->profileId + " error=" + loaded.getError());
    reportFailure(slot->profileId, loaded.getError());
  });

  return Result::ok(slot);
}

Outcome<void> PreferenceRegistry::loadProfile(const juce::String &profileId) {
  auto slot = getSlot(profileId);
  if (slot.isError())
    return Outcome<void>::error(slot.getErrorKind(), slot.getError());
  return slot.getValue()->loadResult;
}

juce::StringArray PreferenceRegistry::getLoadedProfiles() const {
  juce::StringArray ids;
  std::lock_guard<std::mutex> lock(slotsMutex);
  for (const auto &[id, slot] : slots)
    ids.add(id);
  return ids;
}

//==============================================================================
// Mutations

Outcome<PreferenceSet> PreferenceRegistry::mutate(const juce::String &profileId, const juce::String &action,
                                                  const Mutation &mutation) {
  auto slotResult = getSlot(profileId);
  if (slotResult.isError())
    return Outcome<PreferenceSet>::error(slotResult.getErrorKind(), slotResult.getError());

  auto slot = slotResult.getValue();
  PreferenceSet updated;
  juce::uint64 generation = 0;
  bool changed = false;

  {
    std::lock_guard<std::mutex> lock(slot->writeMutex);
    updated = slot->state.getValue();
    changed = mutation(updated);

    if (changed) {
      jassert(updated.isConsistent());
      generation = ++slot->scheduledGeneration;
      ++slot->version;
      slot->state.next(updated);
    }
  }

  if (changed) {
    Util::logDebug(kCategory, action, "profile=" + profileId + " generation=" + juce::String(generation));
    scheduleSave(slot, updated, generation);
  }

  return Outcome<PreferenceSet>::ok(std::move(updated));
}

Outcome<PreferenceSet> PreferenceRegistry::mutateTopic(const juce::String &profileId, const juce::String &rawTopic,
                                                       const juce::String &action,
                                                       std::function<bool(PreferenceSet &, const Topic &)> mutation) {
  auto topic = Topic::parse(rawTopic);
  if (topic.isError()) {
    Util::logDebug(kCategory, "Rejected topic", "action=" + action + " error=" + topic.getError());
    return Outcome<PreferenceSet>::error(topic.getErrorKind(), topic.getError());
  }

  const auto &parsed = topic.getValue();
  return mutate(profileId, action + " \"" + parsed.getText() + "\"",
                [&parsed, &mutation](PreferenceSet &prefs) { return mutation(prefs, parsed); });
}

Outcome<PreferenceSet> PreferenceRegistry::addPreferred(const juce::String &profileId, const juce::String &topic) {
  return mutateTopic(profileId, topic, "addPreferred",
                     [](PreferenceSet &prefs, const Topic &t) { return prefs.prefer(t); });
}

Outcome<PreferenceSet> PreferenceRegistry::removePreferred(const juce::String &profileId, const juce::String &topic) {
  return mutateTopic(profileId, topic, "removePreferred",
                     [](PreferenceSet &prefs, const Topic &t) { return prefs.unprefer(t); });
}

Outcome<PreferenceSet> PreferenceRegistry::addBlocked(const juce::String &profileId, const juce::String &topic) {
  return mutateTopic(profileId, topic, "addBlocked",
                     [](PreferenceSet &prefs, const Topic &t) { return prefs.block(t); });
}

Outcome<PreferenceSet> PreferenceRegistry::removeBlocked(const juce::String &profileId, const juce::String &topic) {
  return mutateTopic(profileId, topic, "removeBlocked",
                     [](PreferenceSet &prefs, const Topic &t) { return prefs.unblock(t); });
}

Outcome<PreferenceSet> PreferenceRegistry::togglePreferred(const juce::String &profileId, const juce::String &topic) {
  return mutateTopic(profileId, topic, "togglePreferred", [](PreferenceSet &prefs, const Topic &t) {
    return prefs.isPreferred(t) ? prefs.unprefer(t) : prefs.prefer(t);
  });
}

Outcome<PreferenceSet> PreferenceRegistry::completeOnboarding(const juce::String &profileId,
                                                              const juce::StringArray &topics) {
  TopicSet chosen;
  for (const auto &raw : topics) {
    auto topic = Topic::parse(raw);
    if (topic.isError())
      return Outcome<PreferenceSet>::error(topic.getErrorKind(), topic.getError());
    chosen.insert(topic.getValue());
  }

  if (static_cast<int>(chosen.size()) < Constants::Onboarding::MIN_TOPICS)
    return Outcome<PreferenceSet>::error(ErrorKind::InvalidTopic, Constants::Errors::NOT_ENOUGH_ONBOARDING_TOPICS);

  return mutate(profileId, "completeOnboarding", [&chosen](PreferenceSet &prefs) {
    bool changed = !prefs.onboardingCompleted;
    prefs.onboardingCompleted = true;
    for (const auto &topic : chosen)
      changed |= prefs.prefer(topic);
    return changed;
  });
}

//==============================================================================
// Reads

Outcome<PreferenceSet> PreferenceRegistry::snapshot(const juce::String &profileId) {
  auto slot = getSlot(profileId);
  if (slot.isError())
    return Outcome<PreferenceSet>::error(slot.getErrorKind(), slot.getError());
  return Outcome<PreferenceSet>::ok(slot.getValue()->state.getValue());
}

Outcome<PreferenceSet> PreferenceRegistry::storedSnapshot(const juce::String &profileId) {
  return loadProfile(profileId).then<PreferenceSet>([this, &profileId]() { return snapshot(profileId); });
}

Outcome<TopicSet> PreferenceRegistry::currentPreferred(const juce::String &profileId) {
  return snapshot(profileId).map<TopicSet>([](const PreferenceSet &prefs) { return prefs.preferred; });
}

Outcome<TopicSet> PreferenceRegistry::currentBlocked(const juce::String &profileId) {
  return snapshot(profileId).map<TopicSet>([](const PreferenceSet &prefs) { return prefs.blocked; });
}

juce::uint64 PreferenceRegistry::version(const juce::String &profileId) const {
  std::lock_guard<std::mutex> lock(slotsMutex);
  auto it = slots.find(profileId);
  return it == slots.end() ? 0 : it->second->version.load();
}

//==============================================================================
// Observation

Outcome<PreferenceRegistry::Unsubscriber> PreferenceRegistry::subscribe(const juce::String &profileId,
                                                                        SnapshotCallback callback) {
  auto slot = getSlot(profileId);
  if (slot.isError())
    return Outcome<Unsubscriber>::error(slot.getErrorKind(), slot.getError());

  // The slot outlives the registry's map entry as long as the unsubscriber exists
  auto held = slot.getValue();
  auto unsub = held->state.subscribe(std::move(callback));
  return Outcome<Unsubscriber>::ok(Unsubscriber([held, unsub]() { unsub(); }));
}

rxcpp::observable<PreferenceSet> PreferenceRegistry::observe(const juce::String &profileId) {
  auto slot = getSlot(profileId);
  if (slot.isError())
    return rxcpp::sources::error<PreferenceSet>(std::runtime_error(slot.getError().toStdString())).as_dynamic();

  // Capturing the slot keeps its subject alive for the observable's lifetime
  auto held = slot.getValue();
  return held->state.asObservable().finally([held]() {}).as_dynamic();
}

//==============================================================================
// Persistence

void PreferenceRegistry::setSaveFailureHandler(SaveFailureHandler handler) {
  std::lock_guard<std::mutex> lock(handlerMutex);
  failureHandler = std::move(handler);
}

void PreferenceRegistry::reportFailure(const juce::String &profileId, const juce::String &message) {
  SaveFailureHandler handler;
  {
    std::lock_guard<std::mutex> lock(handlerMutex);
    handler = failureHandler;
  }

  if (handler)
    handler(profileId, message);
}

void PreferenceRegistry::scheduleSave(const std::shared_ptr<ProfileSlot> &slot, const PreferenceSet &snapshot,
                                      juce::uint64 generation) {
  {
    std::lock_guard<std::mutex> lock(pendingMutex);
    ++pendingSaves;
  }

  bool queued = scheduler && scheduler->scheduleBackground([this, slot, snapshot, generation]() {
    PendingSaveGuard guard(*this);
    runSave(*slot, snapshot, generation);
  });

  if (!queued) {
    finishSave();
    Util::logWarning(kCategory, "Save not scheduled, keeping in-memory state", "profile=" + slot->profileId);
    reportFailure(slot->profileId, Constants::Errors::STORE_WRITE_FAILED);
  }
}

void PreferenceRegistry::runSave(ProfileSlot &slot, const PreferenceSet &snapshot, juce::uint64 generation) {
  std::lock_guard<std::mutex> lock(slot.saveMutex);

  if (generation < slot.scheduledGeneration.load()) {
    Util::logDebug(kCategory, "Skipping superseded save",
                   "profile=" + slot.profileId + " generation=" + juce::String(generation));
    return;
  }

  auto result = Outcome<void>::ok();
  try {
    result = store->save(slot.profileId, snapshot);
  } catch (const std::exception &e) {
    result = Outcome<void>::error(ErrorKind::StoreUnavailable,
                                  juce::String(Constants::Errors::STORE_WRITE_FAILED) + ": " + e.what());
  } catch (...) {
    result = Outcome<void>::error(ErrorKind::StoreUnavailable, Constants::Errors::STORE_WRITE_FAILED);
  }

  if (result.isOk())
    return;

  if (generation < slot.scheduledGeneration.load()) {
    Util::logDebug(kCategory, "Ignoring failure of superseded save", "profile=" + slot.profileId);
    return;
  }

  Util::logWarning(kCategory, "Save failed, keeping in-memory state",
                   "profile=" + slot.profileId + " error=" + result.getError());
  reportFailure(slot.profileId, result.getError());
}

void PreferenceRegistry::finishSave() {
  std::lock_guard<std::mutex> lock(pendingMutex);
  if (--pendingSaves == 0)
    pendingCondition.notify_all();
}

bool PreferenceRegistry::flush(int timeoutMs) {
  std::unique_lock<std::mutex> lock(pendingMutex);
  auto done = [this]() { return pendingSaves == 0; };

  if (timeoutMs <= 0) {
    pendingCondition.wait(lock, done);
    return true;
  }

  return pendingCondition.wait_for(lock, std::chrono::milliseconds(timeoutMs), done);
}

} // namespace Stores
} // namespace Feedwise

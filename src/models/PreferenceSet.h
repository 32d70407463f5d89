#pragma once

#include "../util/json/JsonValidation.h"
#include "Topic.h"
#include <nlohmann/json.hpp>

namespace Feedwise {

// ==============================================================================
/**
 * PreferenceSet - One profile's preferred and blocked topics
 *
 * Invariant: preferred and blocked never share a topic. The mutators keep it
 * by evicting from the opposite side first; callers outside the registry only
 * ever see copies.
 */
struct PreferenceSet {
  TopicSet preferred;
  TopicSet blocked;
  bool onboardingCompleted = false;

  bool isEmpty() const {
    return preferred.empty() && blocked.empty();
  }

  bool isPreferred(const Topic &topic) const {
    return preferred.count(topic) > 0;
  }

  bool isBlocked(const Topic &topic) const {
    return blocked.count(topic) > 0;
  }

  /** Move topic into preferred. Returns false when nothing changed. */
  bool prefer(const Topic &topic);

  /** Move topic into blocked. Returns false when nothing changed. */
  bool block(const Topic &topic);

  bool unprefer(const Topic &topic) {
    return preferred.erase(topic) > 0;
  }

  bool unblock(const Topic &topic) {
    return blocked.erase(topic) > 0;
  }

  /** True when the mutual-exclusion invariant holds */
  bool isConsistent() const;

  bool operator==(const PreferenceSet &other) const {
    return preferred == other.preferred && blocked == other.blocked &&
           onboardingCompleted == other.onboardingCompleted;
  }
  bool operator!=(const PreferenceSet &other) const {
    return !(*this == other);
  }

  FEEDWISE_JSON_TYPE(PreferenceSet)
};

/**
 * Persisted layout:
 *   {"version":1,"preferred":[...],"blocked":[...],"onboarding_completed":false}
 *
 * from_json drops entries that are not valid topics, and a topic listed on
 * both sides is kept as blocked only.
 */
void to_json(nlohmann::json &j, const PreferenceSet &prefs);
void from_json(const nlohmann::json &j, PreferenceSet &prefs);

} // namespace Feedwise

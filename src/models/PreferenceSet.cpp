#include "PreferenceSet.h"
#include "../util/Constants.h"

namespace Feedwise {

bool PreferenceSet::prefer(const Topic &topic) {
  bool changed = blocked.erase(topic) > 0;
  changed |= preferred.insert(topic).second;
  return changed;
}

bool PreferenceSet::block(const Topic &topic) {
  bool changed = preferred.erase(topic) > 0;
  changed |= blocked.insert(topic).second;
  return changed;
}

bool PreferenceSet::isConsistent() const {
  for (const auto &topic : preferred) {
    if (blocked.count(topic) > 0)
      return false;
  }
  return true;
}

namespace {
nlohmann::json topicsToJson(const TopicSet &topics) {
  auto array = nlohmann::json::array();
  for (const auto &topic : topics)
    array.push_back(Json::fromJuceString(topic.getText()));
  return array;
}

TopicSet topicsFromJson(const nlohmann::json &j, const char *field) {
  TopicSet topics;
  for (const auto &raw : Json::optionalStringArray(j, field)) {
    Topic topic(raw);
    if (topic.isValid())
      topics.insert(topic);
  }
  return topics;
}
} // namespace

void to_json(nlohmann::json &j, const PreferenceSet &prefs) {
  j = nlohmann::json{
      {"version", Constants::Storage::FORMAT_VERSION},
      {"preferred", topicsToJson(prefs.preferred)},
      {"blocked", topicsToJson(prefs.blocked)},
      {"onboarding_completed", prefs.onboardingCompleted},
  };
}

void from_json(const nlohmann::json &j, PreferenceSet &prefs) {
  if (!j.is_object())
    throw Json::ValidationError("preferences", "expected object", j.dump());

  int version = 0;
  JSON_OPTIONAL(j, "version", version, Constants::Storage::FORMAT_VERSION);
  if (version > Constants::Storage::FORMAT_VERSION)
    throw Json::ValidationError("version", "unsupported format version " + std::to_string(version));

  prefs.preferred = topicsFromJson(j, "preferred");
  prefs.blocked = topicsFromJson(j, "blocked");
  JSON_OPTIONAL(j, "onboarding_completed", prefs.onboardingCompleted, false);

  for (const auto &topic : prefs.blocked)
    prefs.preferred.erase(topic);
}

} // namespace Feedwise

#include "FeedPersonalizer.h"
#include "../stores/PreferenceRegistry.h"
#include "../util/logging/Logger.h"
#include <algorithm>

namespace Feedwise {

namespace {
const juce::String kCategory = "FeedPersonalizer";
}

//==============================================================================
// PersonalizedFeed

PersonalizedFeed::PersonalizedFeed(std::vector<ContentItem> items, PreferenceSet prefs, ContentFilter contentFilter)
    : source(std::move(items)), preferences(std::move(prefs)), filter(std::move(contentFilter)) {}

void PersonalizedFeed::evaluateIfNeeded() {
  if (evaluated)
    return;
  evaluated = true;

  ranked.reserve(source.size());
  for (const auto &item : source) {
    auto decision = filter.evaluate(item, preferences);
    if (decision.visible)
      ranked.push_back(std::move(decision));
    else
      ++hiddenCount;
  }

  std::stable_sort(ranked.begin(), ranked.end(), [](const FilterDecision &a, const FilterDecision &b) {
    return a.relevanceDelta > b.relevanceDelta;
  });

  Util::logDebug(kCategory, "Personalized batch",
                 "items=" + juce::String(static_cast<int>(source.size())) +
                     " visible=" + juce::String(static_cast<int>(ranked.size())) +
                     " hidden=" + juce::String(hiddenCount));

  source.clear();
  source.shrink_to_fit();
}

bool PersonalizedFeed::hasNext() {
  evaluateIfNeeded();
  return position < ranked.size();
}

std::optional<FilterDecision> PersonalizedFeed::nextDecision() {
  if (!hasNext())
    return std::nullopt;
  return std::move(ranked[position++]);
}

std::optional<ContentItem> PersonalizedFeed::next() {
  auto decision = nextDecision();
  if (!decision)
    return std::nullopt;
  return std::move(decision->item);
}

std::vector<ContentItem> PersonalizedFeed::collect() {
  std::vector<ContentItem> remaining;
  while (auto item = next())
    remaining.push_back(std::move(*item));
  return remaining;
}

int PersonalizedFeed::getHiddenCount() {
  evaluateIfNeeded();
  return hiddenCount;
}

//==============================================================================
// FeedPersonalizer

PersonalizedFeed FeedPersonalizer::apply(std::vector<ContentItem> items, const PreferenceSet &prefs) const {
  return PersonalizedFeed(std::move(items), prefs, filter);
}

PersonalizedFeed FeedPersonalizer::applyFor(Stores::PreferenceRegistry &registry, const juce::String &profileId,
                                            std::vector<ContentItem> items) const {
  auto snapshot = registry.snapshot(profileId);
  snapshot.onError([&profileId](ErrorKind, const juce::String &message) {
    Util::logWarning(kCategory, "No preferences for profile, feed left unfiltered",
                     "profile=" + profileId + " error=" + message);
  });

  return PersonalizedFeed(std::move(items), snapshot.getValueOr(PreferenceSet{}), filter);
}

std::vector<FilterDecision> FeedPersonalizer::explain(const std::vector<ContentItem> &items,
                                                      const PreferenceSet &prefs) const {
  std::vector<FilterDecision> decisions;
  decisions.reserve(items.size());
  for (const auto &item : items)
    decisions.push_back(filter.evaluate(item, prefs));
  return decisions;
}

} // namespace Feedwise

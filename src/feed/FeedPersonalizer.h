#pragma once

#include "../models/ContentItem.h"
#include "../models/FilterDecision.h"
#include "../models/PreferenceSet.h"
#include "ContentFilter.h"
#include <optional>
#include <vector>

namespace Feedwise {

namespace Stores {
class PreferenceRegistry;
}

// ==============================================================================
/**
 * PersonalizedFeed - Visible items of one batch, most relevant first
 *
 * Nothing is evaluated until the first hasNext()/next()/collect(). Items
 * with equal relevance keep their input order. The sequence is consumed once
 * and cannot be rewound; personalize again to pick up new preferences.
 */
class PersonalizedFeed {
public:
  PersonalizedFeed(std::vector<ContentItem> items, PreferenceSet prefs, ContentFilter filter);

  PersonalizedFeed(PersonalizedFeed &&) = default;
  PersonalizedFeed &operator=(PersonalizedFeed &&) = default;
  PersonalizedFeed(const PersonalizedFeed &) = delete;
  PersonalizedFeed &operator=(const PersonalizedFeed &) = delete;

  bool hasNext();

  std::optional<ContentItem> next();

  /** Same as next() but keeps the reason the item ranked where it did */
  std::optional<FilterDecision> nextDecision();

  /** Drain what is left */
  std::vector<ContentItem> collect();

  /** Items dropped by a blocked topic; evaluates if not done yet */
  int getHiddenCount();

private:
  void evaluateIfNeeded();

  std::vector<ContentItem> source;
  PreferenceSet preferences;
  ContentFilter filter;

  bool evaluated = false;
  std::vector<FilterDecision> ranked;
  size_t position = 0;
  int hiddenCount = 0;
};

// ==============================================================================
/**
 * FeedPersonalizer - Applies the ContentFilter to whole listings
 *
 * Usage:
 *   FeedPersonalizer personalizer;
 *   auto feed = personalizer.applyFor(registry, "default", batch);
 *   while (auto item = feed.next())
 *       addRow(*item);
 */
class FeedPersonalizer {
public:
  FeedPersonalizer() = default;
  explicit FeedPersonalizer(ContentFilter contentFilter) : filter(std::move(contentFilter)) {}

  PersonalizedFeed apply(std::vector<ContentItem> items, const PreferenceSet &prefs) const;

  /**
   * Personalize against the registry's latest snapshot for the profile.
   * An invalid profile id is logged and the batch passes through unfiltered.
   */
  PersonalizedFeed applyFor(Stores::PreferenceRegistry &registry, const juce::String &profileId,
                            std::vector<ContentItem> items) const;

  /** Every decision in input order, hidden items included */
  std::vector<FilterDecision> explain(const std::vector<ContentItem> &items, const PreferenceSet &prefs) const;

  const ContentFilter &getFilter() const noexcept {
    return filter;
  }

private:
  ContentFilter filter;
};

} // namespace Feedwise

#pragma once

#include "../models/PreferenceSet.h"
#include "../models/TopicCategory.h"
#include "../util/Constants.h"
#include <JuceHeader.h>
#include <optional>
#include <vector>

namespace Feedwise {
namespace Stores {

/**
 * TopicTaxonomy - Static catalog of topic categories
 *
 * Immutable after construction, so concurrent readers need no locking.
 * builtIn() is the catalog compiled into the app; tests and tools may build
 * their own from a category list.
 *
 * Usage:
 *   const auto& taxonomy = TopicTaxonomy::builtIn();
 *   for (const auto& category : taxonomy.categories())
 *       showCategoryCard(taxonomy.displayName(category), category.topics);
 */
class TopicTaxonomy {
public:
  explicit TopicTaxonomy(std::vector<TopicCategory> categories, juce::StringArray blockSuggestions = {});

  static const TopicTaxonomy &builtIn();

  const std::vector<TopicCategory> &categories() const noexcept {
    return categoryList;
  }

  /** First category listing the topic. Stable for a given catalog. */
  std::optional<TopicCategory> findCategory(const Topic &topic) const;

  /** Every catalog topic in catalog order, duplicates removed */
  std::vector<Topic> allTopics() const;

  /** Category name without a leading icon or bullet */
  static juce::String displayName(const TopicCategory &category);

  /**
   * Quick-add keywords for the block screen that the profile has not
   * blocked yet, in catalog order.
   */
  std::vector<Topic> blockSuggestions(const PreferenceSet &current,
                                      int limit = Constants::Taxonomy::MAX_BLOCK_SUGGESTIONS) const;

private:
  std::vector<TopicCategory> categoryList;
  std::vector<Topic> suggestedBlocks;
};

} // namespace Stores
} // namespace Feedwise

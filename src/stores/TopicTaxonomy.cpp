#include "TopicTaxonomy.h"
#include "../util/StringUtils.h"
#include <set>

namespace Feedwise {
namespace Stores {

namespace {
TopicCategory makeCategory(const char *name, const char *icon, std::initializer_list<const char *> labels) {
  TopicCategory category;
  category.name = juce::String::fromUTF8(name);
  category.icon = juce::String::fromUTF8(icon);

  for (auto *label : labels) {
    Topic topic(juce::String::fromUTF8(label));
    if (topic.isValid() && !category.contains(topic))
      category.topics.push_back(topic);
  }
  return category;
}

std::vector<TopicCategory> builtInCategories() {
  return {
      makeCategory("Gaming", "\xf0\x9f\x8e\xae",
                   {"gaming", "minecraft", "speedrun", "esports", "game reviews", "indie games", "retro games"}),
      makeCategory("Music", "\xf0\x9f\x8e\xb5",
                   {"music", "lofi", "hip hop", "jazz", "classical", "guitar", "music production"}),
      makeCategory("Technology", "\xf0\x9f\x92\xbb",
                   {"technology", "programming", "python", "machine learning", "gadgets", "linux", "smartphones"}),
      makeCategory("Science", "\xf0\x9f\x94\xac",
                   {"science", "physics", "space", "biology", "chemistry", "mathematics", "astronomy"}),
      makeCategory("Education", "\xf0\x9f\x93\x9a",
                   {"history", "language learning", "documentary", "economics", "philosophy", "geography"}),
      makeCategory("Food", "\xf0\x9f\x8d\xb3", {"cooking", "baking", "recipes", "street food", "vegan"}),
      makeCategory("Sports", "\xe2\x9a\xbd", {"football", "basketball", "fitness", "running", "cycling", "climbing"}),
      makeCategory("Entertainment", "\xf0\x9f\x8e\xac", {"movies", "comedy", "anime", "tv shows", "podcasts"}),
      makeCategory("Travel", "\xe2\x9c\x88\xef\xb8\x8f", {"travel", "hiking", "camping", "van life"}),
      makeCategory("Creative", "\xf0\x9f\x8e\xa8", {"art", "drawing", "photography", "design", "diy", "woodworking"}),
      makeCategory("Automotive", "\xf0\x9f\x9a\x97", {"cars", "motorcycles", "electric vehicles", "formula 1"}),
      makeCategory("Finance", "\xf0\x9f\x92\xb0", {"investing", "personal finance", "entrepreneurship", "crypto"}),
  };
}

juce::StringArray builtInBlockSuggestions() {
  return {"makeup", "roblox",    "fortnite", "kids",  "asmr",  "mukbang",   "reaction",    "prank", "tiktok",
          "unboxing", "slime", "toy",      "clickbait", "drama", "gossip", "challenge", "family vlog"};
}
} // namespace

TopicTaxonomy::TopicTaxonomy(std::vector<TopicCategory> categories, juce::StringArray blockSuggestions)
    : categoryList(std::move(categories)) {
  std::set<Topic> seen;
  for (const auto &raw : blockSuggestions) {
    Topic topic(raw);
    if (topic.isValid() && seen.insert(topic).second)
      suggestedBlocks.push_back(topic);
  }
}

const TopicTaxonomy &TopicTaxonomy::builtIn() {
  static const TopicTaxonomy instance(builtInCategories(), builtInBlockSuggestions());
  return instance;
}

std::optional<TopicCategory> TopicTaxonomy::findCategory(const Topic &topic) const {
  for (const auto &category : categoryList) {
    if (category.contains(topic))
      return category;
  }
  return std::nullopt;
}

std::vector<Topic> TopicTaxonomy::allTopics() const {
  std::vector<Topic> topics;
  std::set<Topic> seen;
  for (const auto &category : categoryList) {
    for (const auto &topic : category.topics) {
      if (seen.insert(topic).second)
        topics.push_back(topic);
    }
  }
  return topics;
}

juce::String TopicTaxonomy::displayName(const TopicCategory &category) {
  return StringUtils::stripLeadingNonLetters(category.name);
}

std::vector<Topic> TopicTaxonomy::blockSuggestions(const PreferenceSet &current, int limit) const {
  std::vector<Topic> suggestions;
  for (const auto &topic : suggestedBlocks) {
    if (static_cast<int>(suggestions.size()) >= limit)
      break;
    if (!current.isBlocked(topic))
      suggestions.push_back(topic);
  }
  return suggestions;
}

} // namespace Stores
} // namespace Feedwise

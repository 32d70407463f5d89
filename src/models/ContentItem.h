#pragma once

#include "../util/Result.h"
#include "../util/json/JsonValidation.h"
#include <JuceHeader.h>
#include <nlohmann/json.hpp>
#include <vector>

namespace Feedwise {

// ==============================================================================
/**
 * ContentItem - One entry of an incoming content listing (a video)
 *
 * Consumed read-only by the filter. Only title, description and tags are
 * searched; id and channelName identify the item for display and logs.
 */
struct ContentItem {
  juce::String id;
  juce::String title;
  juce::String description;
  juce::StringArray tags;
  juce::String channelName;

  /** Title, description and tags joined with spaces, not yet normalized */
  juce::String getSearchableText() const;

  bool operator==(const ContentItem &other) const {
    return id == other.id && title == other.title && description == other.description && tags == other.tags &&
           channelName == other.channelName;
  }

  FEEDWISE_JSON_TYPE(ContentItem)
};

inline void to_json(nlohmann::json &j, const ContentItem &item) {
  j = nlohmann::json{
      {"id", Json::fromJuceString(item.id)},
      {"title", Json::fromJuceString(item.title)},
      {"description", Json::fromJuceString(item.description)},
      {"tags", Json::toJsonArray(item.tags)},
      {"channel_name", Json::fromJuceString(item.channelName)},
  };
}

inline void from_json(const nlohmann::json &j, ContentItem &item) {
  if (!j.is_object())
    throw Json::ValidationError("item", "expected object", j.dump());

  JSON_OPTIONAL_STRING(j, "id", item.id, "");
  JSON_REQUIRE_STRING(j, "title", item.title);
  JSON_OPTIONAL_STRING(j, "description", item.description, "");
  item.tags = Json::optionalStringArray(j, "tags");
  JSON_OPTIONAL_STRING(j, "channel_name", item.channelName, "");
}

/**
 * Parse a JSON array of items (feed files, API batches).
 * Returns the first validation failure as an error.
 */
Outcome<std::vector<ContentItem>> parseContentItems(const juce::String &jsonText);

} // namespace Feedwise

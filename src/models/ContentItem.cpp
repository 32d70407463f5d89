#include "ContentItem.h"

namespace Feedwise {

juce::String ContentItem::getSearchableText() const {
  juce::String text;
  text << title << ' ' << description;
  for (const auto &tag : tags)
    text << ' ' << tag;
  return text;
}

Outcome<std::vector<ContentItem>> parseContentItems(const juce::String &jsonText) {
  using Result = Outcome<std::vector<ContentItem>>;

  auto parsed = nlohmann::json::parse(jsonText.toStdString(), nullptr, false);
  if (parsed.is_discarded())
    return Result::error("Feed is not valid JSON");

  if (!parsed.is_array())
    return Result::error("Feed must be a JSON array of items");

  std::vector<ContentItem> items;
  items.reserve(parsed.size());

  try {
    for (const auto &element : parsed)
      items.push_back(ContentItem::fromJson(element));
  } catch (const Json::ValidationError &e) {
    return Result::error("Item " + juce::String(static_cast<int>(items.size())) + ": " + juce::String(e.what()));
  }

  return Result::ok(std::move(items));
}

} // namespace Feedwise

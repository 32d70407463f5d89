#pragma once

#include "ContentItem.h"
#include "Topic.h"
#include <optional>
#include <vector>

namespace Feedwise {

// ==============================================================================
/**
 * FilterDecision - Result of running one ContentItem through the ContentFilter
 *
 * blockedBy and matchedPreferred record why the decision came out the way it
 * did, so the UI can explain a hidden or boosted item.
 */
struct FilterDecision {
  ContentItem item;
  bool visible = true;
  double relevanceDelta = 0.0;

  std::optional<Topic> blockedBy;      // first blocked topic found (set order)
  std::vector<Topic> matchedPreferred; // distinct preferred topics found (set order)

  juce::String explain() const {
    if (!visible)
      return "hidden: matches blocked topic \"" + (blockedBy ? blockedBy->getText() : juce::String("?")) + "\"";

    if (matchedPreferred.empty())
      return "no preferred topics";

    juce::StringArray names;
    for (const auto &topic : matchedPreferred)
      names.add(topic.getText());
    return "boosted by " + names.joinIntoString(", ");
  }
};

} // namespace Feedwise

#pragma once

#include "Topic.h"
#include <JuceHeader.h>
#include <algorithm>
#include <vector>

namespace Feedwise {

// ==============================================================================
/**
 * TopicCategory - A named group of canonical topics shown in the topic picker
 *
 * Topics are unique within a category and keep their catalog order.
 */
struct TopicCategory {
  juce::String name;
  juce::String icon; // UTF-8 glyph
  std::vector<Topic> topics;

  bool contains(const Topic &topic) const {
    return std::find(topics.begin(), topics.end(), topic) != topics.end();
  }
};

} // namespace Feedwise

#pragma once

#include "../models/ContentItem.h"
#include "../models/FilterDecision.h"
#include "../models/PreferenceSet.h"
#include "../util/Constants.h"
#include <JuceHeader.h>
#include <optional>

namespace Feedwise {

/**
 * How a topic is looked for in an item's text.
 *
 * WordBoundary: the topic's words must appear consecutively among the text's
 *               words ("asmr" matches "ASMR eating", not "asmrookie")
 * Substring:    plain containment on the normalized text
 */
enum class MatchMode { WordBoundary, Substring };

juce::String matchModeToString(MatchMode mode);
std::optional<MatchMode> parseMatchMode(const juce::String &text);

// ==============================================================================
/**
 * ContentFilter - Decides visibility and relevance of one item
 *
 * Stateless apart from its configuration, so one instance can be shared
 * between threads. Blocked topics are checked first and win over any
 * preferred match; each distinct preferred topic found adds boostUnit.
 *
 * evaluate() never throws: an unexpected failure yields a visible item with
 * zero delta and an error log line.
 */
class ContentFilter {
public:
  struct Config {
    double boostUnit = Constants::Filter::DEFAULT_BOOST_UNIT;
    MatchMode matchMode = MatchMode::WordBoundary;
  };

  ContentFilter() = default;
  explicit ContentFilter(const Config &config);
  virtual ~ContentFilter() = default;

  ContentFilter(const ContentFilter &) = default;
  ContentFilter &operator=(const ContentFilter &) = default;

  FilterDecision evaluate(const ContentItem &item, const PreferenceSet &prefs) const;

  const Config &getConfig() const noexcept {
    return config;
  }

  /** True if words contains topicWords as a contiguous run */
  static bool containsWordSequence(const juce::StringArray &words, const juce::StringArray &topicWords);

protected:
  /** The scoring itself; evaluate() guards it */
  virtual FilterDecision evaluateUnchecked(const ContentItem &item, const PreferenceSet &prefs) const;

private:
  Config config;

  bool matches(const Topic &topic, const juce::String &normalizedText, const juce::StringArray &words) const;
  static FilterDecision unchanged(const ContentItem &item, const juce::String &reason);
};

} // namespace Feedwise

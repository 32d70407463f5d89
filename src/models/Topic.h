#pragma once

#include "../util/Result.h"
#include <JuceHeader.h>
#include <set>

namespace Feedwise {

// ==============================================================================
/**
 * Topic - A normalized free-text interest or exclusion keyword
 *
 * The constructor canonicalizes: lower-case, trimmed, internal whitespace
 * collapsed. Two inputs that differ only in case or spacing are the same
 * Topic. Comparison never happens on raw text anywhere else.
 *
 * A Topic is valid when its normalized text contains a letter or digit.
 * Use Topic::parse() at input boundaries to get an InvalidTopic error
 * instead of an invalid value.
 */
class Topic {
public:
  Topic() = default;
  explicit Topic(const juce::String &rawText);

  /** Normalize and validate user input */
  static Outcome<Topic> parse(const juce::String &rawText);

  const juce::String &getText() const noexcept {
    return text;
  }

  /** Words used for word-boundary matching ("family-vlog" -> family, vlog) */
  const juce::StringArray &getWords() const noexcept {
    return words;
  }

  bool isValid() const noexcept {
    return !words.isEmpty();
  }

  bool operator==(const Topic &other) const noexcept {
    return text == other.text;
  }
  bool operator!=(const Topic &other) const noexcept {
    return text != other.text;
  }
  bool operator<(const Topic &other) const noexcept {
    return text.compare(other.text) < 0;
  }

private:
  juce::String text;
  juce::StringArray words;
};

/** Ordered by normalized text so iteration and serialization are stable */
using TopicSet = std::set<Topic>;

/** Comma separated list for logs and CLI output */
juce::String describeTopics(const TopicSet &topics);

} // namespace Feedwise

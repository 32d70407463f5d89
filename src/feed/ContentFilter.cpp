#include "ContentFilter.h"
#include "../util/StringUtils.h"
#include "../util/logging/Logger.h"

namespace Feedwise {

namespace {
const juce::String kCategory = "ContentFilter";
}

juce::String matchModeToString(MatchMode mode) {
  switch (mode) {
  case MatchMode::Substring:
    return "substring";
  case MatchMode::WordBoundary:
  default:
    return "word";
  }
}

std::optional<MatchMode> parseMatchMode(const juce::String &text) {
  auto normalized = text.trim().toLowerCase();
  if (normalized == "word" || normalized == "wordboundary")
    return MatchMode::WordBoundary;
  if (normalized == "substring")
    return MatchMode::Substring;
  return std::nullopt;
}

//==============================================================================

ContentFilter::ContentFilter(const Config &filterConfig) : config(filterConfig) {
  if (!(config.boostUnit > 0.0)) {
    Util::logWarning(kCategory, "Boost unit must be positive, using default",
                     "boostUnit=" + juce::String(config.boostUnit));
    config.boostUnit = Constants::Filter::DEFAULT_BOOST_UNIT;
  }
}

bool ContentFilter::containsWordSequence(const juce::StringArray &words, const juce::StringArray &topicWords) {
  const int needle = topicWords.size();
  const int haystack = words.size();
  if (needle == 0 || needle > haystack)
    return false;

  for (int start = 0; start + needle <= haystack; ++start) {
    int matched = 0;
    while (matched < needle && words[start + matched] == topicWords[matched])
      ++matched;
    if (matched == needle)
      return true;
  }
  return false;
}

bool ContentFilter::matches(const Topic &topic, const juce::String &normalizedText,
                            const juce::StringArray &words) const {
  if (!topic.isValid())
    return false;

  if (config.matchMode == MatchMode::Substring)
    return normalizedText.contains(topic.getText());

  return containsWordSequence(words, topic.getWords());
}

FilterDecision ContentFilter::evaluateUnchecked(const ContentItem &item, const PreferenceSet &prefs) const {
  FilterDecision decision;
  decision.item = item;

  if (prefs.isEmpty())
    return decision;

  auto searchable = item.getSearchableText();
  auto normalizedText = StringUtils::normalizeText(searchable);
  auto words = StringUtils::splitWords(normalizedText);

  for (const auto &topic : prefs.blocked) {
    if (matches(topic, normalizedText, words)) {
      decision.visible = false;
      decision.blockedBy = topic;
      return decision;
    }
  }

  for (const auto &topic : prefs.preferred) {
    if (matches(topic, normalizedText, words))
      decision.matchedPreferred.push_back(topic);
  }

  decision.relevanceDelta = static_cast<double>(decision.matchedPreferred.size()) * config.boostUnit;
  return decision;
}

FilterDecision ContentFilter::unchanged(const ContentItem &item, const juce::String &reason) {
  Util::logError(kCategory, "Evaluation failed, showing item unchanged", "item=" + item.id + " error=" + reason);

  FilterDecision fallback;
  fallback.item = item;
  return fallback;
}

FilterDecision ContentFilter::evaluate(const ContentItem &item, const PreferenceSet &prefs) const {
  try {
    return evaluateUnchecked(item, prefs);
  } catch (const std::exception &e) {
    return unchanged(item, e.what());
  } catch (...) {
    return unchanged(item, "non-standard exception");
  }
}

} // namespace Feedwise

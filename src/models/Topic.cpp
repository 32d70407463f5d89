#include "Topic.h"
#include "../util/Constants.h"
#include "../util/StringUtils.h"

namespace Feedwise {

Topic::Topic(const juce::String &rawText)
    : text(StringUtils::normalizeText(rawText)), words(StringUtils::splitWords(text)) {}

Outcome<Topic> Topic::parse(const juce::String &rawText) {
  Topic topic(rawText);

  if (topic.text.isEmpty())
    return Outcome<Topic>::error(ErrorKind::InvalidTopic, Constants::Errors::EMPTY_TOPIC);

  if (!topic.isValid())
    return Outcome<Topic>::error(ErrorKind::InvalidTopic,
                                 Constants::Errors::TOPIC_WITHOUT_LETTERS + juce::String(": ") + topic.text);

  return Outcome<Topic>::ok(std::move(topic));
}

juce::String describeTopics(const TopicSet &topics) {
  juce::StringArray names;
  for (const auto &topic : topics)
    names.add(topic.getText());
  return names.joinIntoString(", ");
}

} // namespace Feedwise

#include <catch2/catch_test_macros.hpp>
#include "models/Topic.h"
#include "util/StringUtils.h"

using namespace Feedwise;

//==============================================================================
TEST_CASE("StringUtils::normalizeText", "[StringUtils]") {
  SECTION("lower-cases and trims") {
    REQUIRE(StringUtils::normalizeText("  Machine Learning ") == "machine learning");
  }

  SECTION("collapses every whitespace run to one space") {
    REQUIRE(StringUtils::normalizeText("ASMR\t\tEating \n Show") == "asmr eating show");
  }

  SECTION("empty and blank input") {
    REQUIRE(StringUtils::normalizeText("").isEmpty());
    REQUIRE(StringUtils::normalizeText(" \t\n ").isEmpty());
  }
}

TEST_CASE("StringUtils::splitWords", "[StringUtils]") {
  SECTION("punctuation and hyphens separate words") {
    auto words = StringUtils::splitWords("Family-Vlog #12!");
    REQUIRE(words.size() == 3);
    REQUIRE(words[0] == "family");
    REQUIRE(words[1] == "vlog");
    REQUIRE(words[2] == "12");
  }

  SECTION("a longer word stays whole") {
    auto words = StringUtils::splitWords("asmrookie unboxing");
    REQUIRE(words.size() == 2);
    REQUIRE(words[0] == "asmrookie");
  }

  SECTION("nothing alphanumeric gives no words") {
    REQUIRE(StringUtils::splitWords("!!! ---").isEmpty());
  }
}

TEST_CASE("StringUtils with non-ASCII text", "[StringUtils]") {
  SECTION("accented letters stay inside the word") {
    auto words = StringUtils::splitWords(juce::String::fromUTF8("\xc3\x91and\xc3\xba")); // Ñandú
    REQUIRE(words.size() == 1);
    REQUIRE(words[0] == juce::String::fromUTF8("\xc3\xb1and\xc3\xba"));
  }

  SECTION("Cyrillic and CJK are word characters") {
    REQUIRE(StringUtils::containsLetterOrDigit(juce::String::fromUTF8("\xd1\x84\xd0\xb8\xd0\xbb\xd1\x8c\xd0\xbc")));
    REQUIRE(StringUtils::containsLetterOrDigit(juce::String::fromUTF8("\xe6\x97\xa5\xe6\x9c\xac")));
  }

  SECTION("emoji and symbols still separate words") {
    auto words = StringUtils::splitWords(juce::String::fromUTF8("rock\xf0\x9f\x8e\xb8roll \xe2\x80\x94 live"));
    REQUIRE(words.size() == 3);
    REQUIRE(words[1] == "roll");
    REQUIRE_FALSE(StringUtils::containsLetterOrDigit(juce::String::fromUTF8("\xf0\x9f\x8e\xae \xe2\x9a\xbd")));
  }

  SECTION("case folding covers Latin, Greek and Cyrillic") {
    REQUIRE(StringUtils::toLowerCase(0xD1) == 0xF1);
    REQUIRE(StringUtils::toLowerCase(0x141) == 0x142);
    REQUIRE(StringUtils::toLowerCase(0x3A9) == 0x3C9);
    REQUIRE(StringUtils::toLowerCase(0x424) == 0x444);
    REQUIRE(StringUtils::toLowerCase(0x401) == 0x451);
    REQUIRE(StringUtils::toLowerCase(0x65E5) == 0x65E5);
  }
}

TEST_CASE("StringUtils::stripLeadingNonLetters", "[StringUtils]") {
  REQUIRE(StringUtils::stripLeadingNonLetters(juce::String::fromUTF8("\xf0\x9f\x8e\xae Gaming")) == "Gaming");
  REQUIRE(StringUtils::stripLeadingNonLetters("* Music") == "Music");
  REQUIRE(StringUtils::stripLeadingNonLetters("Science") == "Science");
}

//==============================================================================
TEST_CASE("Topic normalization", "[Topic]") {
  SECTION("case and spacing variants are the same topic") {
    REQUIRE(Topic("ASMR") == Topic("  asmr "));
    REQUIRE(Topic("Machine   Learning") == Topic("machine learning"));
    REQUIRE(Topic("Machine Learning").getText() == "machine learning");
  }

  SECTION("different text is a different topic") {
    REQUIRE(Topic("asmr") != Topic("asmrookie"));
  }

  SECTION("words are cached for matching") {
    Topic topic("Family-Vlog");
    REQUIRE(topic.getText() == "family-vlog");
    REQUIRE(topic.getWords().size() == 2);
    REQUIRE(topic.getWords()[0] == "family");
    REQUIRE(topic.getWords()[1] == "vlog");
  }

  SECTION("ordering follows normalized text") {
    REQUIRE(Topic("Apple") < Topic("banana"));
    REQUIRE_FALSE(Topic("banana") < Topic("APPLE"));
  }
}

TEST_CASE("Topic::parse", "[Topic]") {
  SECTION("valid text") {
    auto result = Topic::parse("  Cooking ");
    REQUIRE(result.isOk());
    REQUIRE(result.getValue().getText() == "cooking");
  }

  SECTION("empty text is InvalidTopic") {
    auto result = Topic::parse("   ");
    REQUIRE(result.isError());
    REQUIRE(result.getErrorKind() == ErrorKind::InvalidTopic);
  }

  SECTION("text without letters or digits is InvalidTopic") {
    auto result = Topic::parse("#!?");
    REQUIRE(result.isError());
    REQUIRE(result.getErrorKind() == ErrorKind::InvalidTopic);
  }

  SECTION("digits alone are valid") {
    REQUIRE(Topic::parse("2048").isOk());
  }

  SECTION("non-ASCII scripts are valid") {
    REQUIRE(Topic::parse(juce::String::fromUTF8("\xd1\x84\xd0\xb8\xd0\xbb\xd1\x8c\xd0\xbc")).isOk()); // фильм
    REQUIRE(Topic::parse(juce::String::fromUTF8("\xe6\x97\xa5\xe6\x9c\xac")).isOk());                  // 日本
  }

  SECTION("upper and lower case accented text is one topic") {
    auto upper = Topic::parse(juce::String::fromUTF8("\xc3\x91AND\xc3\x9a")); // ÑANDÚ
    auto lower = Topic::parse(juce::String::fromUTF8("\xc3\xb1and\xc3\xba")); // ñandú
    REQUIRE(upper.isOk());
    REQUIRE(lower.isOk());
    REQUIRE(upper.getValue() == lower.getValue());
    REQUIRE(upper.getValue().getWords().size() == 1);
  }
}

TEST_CASE("Topic in a TopicSet", "[Topic]") {
  TopicSet topics;
  topics.insert(Topic("Gaming"));
  topics.insert(Topic("gaming "));
  topics.insert(Topic("Art"));

  REQUIRE(topics.size() == 2);
  REQUIRE(describeTopics(topics) == "art, gaming");
}

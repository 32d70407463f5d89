#include "StringUtils.h"

namespace Feedwise {
namespace StringUtils {

bool isWordCharacter(juce::juce_wchar c) {
  if (c < 0x80)
    return juce::CharacterFunctions::isLetterOrDigit(c);

  if (c <= 0xBF || c == 0xD7 || c == 0xF7) // Latin-1 controls, punctuation and symbols
    return false;
  if (c >= 0x2000 && c <= 0x2BFF) // punctuation, arrows, math, box drawing, dingbats
    return false;
  if (c >= 0x3000 && c <= 0x303F) // CJK punctuation
    return false;
  if ((c >= 0xFE00 && c <= 0xFE0F) || c == 0xFEFF) // variation selectors, BOM
    return false;
  if (c >= 0xFF00 && c <= 0xFF0F) // full-width punctuation
    return false;
  if (c >= 0x1F000 && c <= 0x1FAFF) // emoji and pictographs
    return false;
  if (c >= 0xE0000) // tags, private use
    return false;

  return true;
}

juce::juce_wchar toLowerCase(juce::juce_wchar c) {
  auto lowered = juce::CharacterFunctions::toLowerCase(c);
  if (lowered != c || c < 0x80)
    return lowered;

  // towlower only knows ASCII in the "C" locale
  if ((c >= 0xC0 && c <= 0xDE && c != 0xD7) || (c >= 0x391 && c <= 0x3AB && c != 0x3A2) ||
      (c >= 0x410 && c <= 0x42F))
    return c + 0x20;
  if (c >= 0x400 && c <= 0x40F)
    return c + 0x50;
  if (c == 0x130)
    return 'i';
  if (c == 0x178)
    return 0xFF;
  if (c >= 0x100 && c <= 0x17E) {
    bool upperIsEven = (c <= 0x137) || (c >= 0x14A && c <= 0x177);
    if ((c % 2 == 0) == upperIsEven)
      return c + 1;
  }
  return c;
}

juce::String normalizeText(const juce::String &text) {
  juce::String result;
  result.preallocateBytes(text.getNumBytesAsUTF8());

  bool pendingSpace = false;
  for (auto ptr = text.getCharPointer(); !ptr.isEmpty(); ++ptr) {
    auto c = *ptr;
    if (juce::CharacterFunctions::isWhitespace(c)) {
      pendingSpace = result.isNotEmpty();
      continue;
    }

    if (pendingSpace) {
      result << ' ';
      pendingSpace = false;
    }
    result << juce::String::charToString(toLowerCase(c));
  }

  return result;
}

bool containsLetterOrDigit(const juce::String &text) {
  for (auto ptr = text.getCharPointer(); !ptr.isEmpty(); ++ptr) {
    if (isWordCharacter(*ptr))
      return true;
  }
  return false;
}

juce::StringArray splitWords(const juce::String &text) {
  juce::StringArray words;
  juce::String current;

  for (auto ptr = text.getCharPointer(); !ptr.isEmpty(); ++ptr) {
    auto c = *ptr;
    if (isWordCharacter(c)) {
      current << juce::String::charToString(toLowerCase(c));
    } else if (current.isNotEmpty()) {
      words.add(current);
      current.clear();
    }
  }

  if (current.isNotEmpty())
    words.add(current);

  return words;
}

juce::String stripLeadingNonLetters(const juce::String &text) {
  auto ptr = text.getCharPointer();
  while (!ptr.isEmpty() && !(isWordCharacter(*ptr) && !juce::CharacterFunctions::isDigit(*ptr)))
    ++ptr;

  return juce::String(ptr).trim();
}

} // namespace StringUtils
} // namespace Feedwise

#pragma once

#include <JuceHeader.h>

// ==============================================================================
/**
 * String manipulation utilities shared by topic normalization and the
 * content filter. Both sides must canonicalize text identically or matching
 * breaks, so the rules live in exactly one place.
 */
namespace Feedwise {
namespace StringUtils {

/**
 * True for characters that belong to a word: ASCII letters and digits, and
 * any non-ASCII character outside the punctuation, symbol and emoji blocks.
 * Independent of the C library locale, so "ñandú" and "фильм" are single
 * words even when the process runs in the "C" locale.
 */
bool isWordCharacter(juce::juce_wchar c);

/**
 * Lower-case one character. Uses the C library first, then a built-in table
 * for Latin-1, Latin Extended-A, Greek and Cyrillic when the locale does not
 * know the character.
 */
juce::juce_wchar toLowerCase(juce::juce_wchar c);

/**
 * Canonical form for topics and searchable text.
 *
 * Lower-cases, trims, and collapses every run of whitespace to one space.
 * Examples:
 * - "  Machine   Learning " -> "machine learning"
 * - "ASMR\tEating"          -> "asmr eating"
 */
juce::String normalizeText(const juce::String &text);

/** True if the text contains at least one word character. */
bool containsLetterOrDigit(const juce::String &text);

/**
 * Split text into lower-case words. A word is a maximal run of word
 * characters; everything else (spaces, hyphens, punctuation, emoji) separates.
 * Examples:
 * - "Family-Vlog #12!" -> ["family", "vlog", "12"]
 * - "asmrookie"        -> ["asmrookie"]
 */
juce::StringArray splitWords(const juce::String &text);

/**
 * Strip leading characters that are not letters (icons, emoji, bullets).
 * "🎮 Gaming" -> "Gaming"
 */
juce::String stripLeadingNonLetters(const juce::String &text);

} // namespace StringUtils
} // namespace Feedwise

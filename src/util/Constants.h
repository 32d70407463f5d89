#pragma once

#include <cstddef>

// ==============================================================================
/**
 * Constants - Centralized magic numbers for Feedwise
 *
 * Groupings:
 *   - Errors: user-facing error messages
 *   - Filter: content filter scoring
 *   - Storage: preference file layout
 *   - Onboarding: first-run topic picker rules
 *   - Config: settings keys and defaults
 *
 * Usage:
 *   #include "util/Constants.h"
 *
 *   double delta = matches * Constants::Filter::DEFAULT_BOOST_UNIT;
 */
namespace Feedwise {
namespace Constants {

// ==========================================================================
// Error Messages
// ==========================================================================
namespace Errors {
constexpr const char *EMPTY_TOPIC = "Topic is empty";
constexpr const char *TOPIC_WITHOUT_LETTERS = "Topic has no letters or digits";
constexpr const char *EMPTY_PROFILE = "Profile id is empty";
constexpr const char *NOT_ENOUGH_ONBOARDING_TOPICS = "Pick at least 3 topics";
constexpr const char *STORE_READ_FAILED = "Could not read preferences";
constexpr const char *STORE_WRITE_FAILED = "Could not write preferences";
constexpr const char *STORE_CORRUPT = "Preferences file is corrupt";
} // namespace Errors

// ==========================================================================
// Content Filter
// ==========================================================================
namespace Filter {
// Relevance added per distinct preferred topic found in an item
constexpr double DEFAULT_BOOST_UNIT = 1.0;
} // namespace Filter

// ==========================================================================
// Preference Storage
// ==========================================================================
namespace Storage {
constexpr int FORMAT_VERSION = 1;
constexpr const char *FILE_SUFFIX = ".topics.json";
constexpr const char *DEFAULT_PROFILE = "default";
} // namespace Storage

// ==========================================================================
// Onboarding
// ==========================================================================
namespace Onboarding {
constexpr int MIN_TOPICS = 3;
} // namespace Onboarding

// ==========================================================================
// Taxonomy
// ==========================================================================
namespace Taxonomy {
// Quick-add block chips shown at once
constexpr int MAX_BLOCK_SUGGESTIONS = 12;
} // namespace Taxonomy

// ==========================================================================
// Settings keys (PropertiesFile)
// ==========================================================================
namespace Config {
constexpr const char *PREFERENCES_DIRECTORY = "preferences.directory";
constexpr const char *BOOST_UNIT = "filter.boostUnit";
constexpr const char *MATCH_MODE = "filter.matchMode";
constexpr const char *LOG_LEVEL = "log.level";
constexpr const char *LOG_FILE = "log.file";
constexpr const char *SCHEDULER_THREADS = "scheduler.threads";

constexpr int DEFAULT_SCHEDULER_THREADS = 2;
constexpr int MAX_SCHEDULER_THREADS = 8;
} // namespace Config

} // namespace Constants
} // namespace Feedwise

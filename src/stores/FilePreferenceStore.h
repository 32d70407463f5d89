#pragma once

#include "PreferenceStore.h"
#include <JuceHeader.h>

namespace Feedwise {
namespace Stores {

//==============================================================================
/**
 * FilePreferenceStore - One JSON file per profile in a directory
 *
 * Default location:
 * - Linux: ~/.config/Feedwise/preferences/
 * - macOS: ~/Library/Application Support/Feedwise/preferences/
 * - Windows: %APPDATA%/Feedwise/preferences/
 *
 * Each profile is stored as <escaped profile id>.topics.json. Writes go to a
 * hidden temporary sibling that is renamed over the target.
 */
class FilePreferenceStore : public PreferenceStore {
public:
  explicit FilePreferenceStore(const juce::File &directory = getDefaultDirectory());
  ~FilePreferenceStore() override = default;

  Outcome<PreferenceSet> load(const juce::String &profileId) override;
  Outcome<void> save(const juce::String &profileId, const PreferenceSet &prefs) override;

  juce::String getName() const override {
    return "FilePreferenceStore";
  }

  static juce::File getDefaultDirectory();

  juce::File getDirectory() const {
    return directory;
  }

  /** Path the profile is stored at (the file may not exist yet) */
  juce::File getProfileFile(const juce::String &profileId) const;

private:
  juce::File directory;

  Outcome<void> ensureDirectory();

  JUCE_DECLARE_NON_COPYABLE(FilePreferenceStore)
};

} // namespace Stores
} // namespace Feedwise

#pragma once

#include "../models/PreferenceSet.h"
#include "../util/Result.h"
#include <JuceHeader.h>

namespace Feedwise {
namespace Stores {

//==============================================================================
/**
 * PreferenceStore - Durable storage of one PreferenceSet per profile
 *
 * Contract:
 * - load() on a profile that was never saved returns an empty set, not an error
 * - save() is atomic: a concurrent or later reader sees either the previous
 *   or the new set, never a partial write
 * - I/O and parse failures are reported as ErrorKind::StoreUnavailable
 *
 * Implementations must be safe to call from the registry's save workers; the
 * registry never issues two saves for the same profile at once.
 */
class PreferenceStore {
public:
  virtual ~PreferenceStore() = default;

  virtual Outcome<PreferenceSet> load(const juce::String &profileId) = 0;

  virtual Outcome<void> save(const juce::String &profileId, const PreferenceSet &prefs) = 0;

  virtual juce::String getName() const = 0;
};

} // namespace Stores
} // namespace Feedwise

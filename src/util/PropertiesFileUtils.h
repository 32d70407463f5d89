#pragma once

#include <JuceHeader.h>

namespace Feedwise {
namespace Util {

/**
 * Utility functions for working with JUCE PropertiesFile
 */
class PropertiesFileUtils {
public:
  /**
   * Standard PropertiesFile::Options for Feedwise settings
   *
   * The engine reads its own keys from this file; scalar app settings
   * (download threads, quality, Wi-Fi only) live beside them untouched.
   */
  static juce::PropertiesFile::Options getStandardOptions() {
    juce::PropertiesFile::Options options;
    options.applicationName = "Feedwise";
    options.filenameSuffix = ".settings";
    options.folderName = "Feedwise";
    options.osxLibrarySubFolder = "Application Support"; // Required on macOS to avoid jassert
    return options;
  }
};

} // namespace Util
} // namespace Feedwise

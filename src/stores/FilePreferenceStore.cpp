#include "FilePreferenceStore.h"
#include "../util/Constants.h"
#include "../util/logging/Logger.h"

namespace Feedwise {
namespace Stores {

namespace {
const juce::String kCategory = "PreferenceStore";

Outcome<void> checkProfileId(const juce::String &profileId) {
  if (profileId.trim().isEmpty())
    return Outcome<void>::error(ErrorKind::InvalidProfile, Constants::Errors::EMPTY_PROFILE);
  return Outcome<void>::ok();
}
} // namespace

//==============================================================================

FilePreferenceStore::FilePreferenceStore(const juce::File &storageDirectory) : directory(storageDirectory) {
  Util::logInfo(kCategory, "Using preferences directory", "path=" + directory.getFullPathName());
}

juce::File FilePreferenceStore::getDefaultDirectory() {
  return juce::File::getSpecialLocation(juce::File::userApplicationDataDirectory)
      .getChildFile("Feedwise")
      .getChildFile("preferences");
}

juce::File FilePreferenceStore::getProfileFile(const juce::String &profileId) const {
  return directory.getChildFile(juce::URL::addEscapeChars(profileId, true) + Constants::Storage::FILE_SUFFIX);
}

Outcome<void> FilePreferenceStore::ensureDirectory() {
  if (directory.isDirectory())
    return Outcome<void>::ok();

  auto result = directory.createDirectory();
  if (result.failed()) {
    Util::logError(kCategory, "Failed to create preferences directory", result.getErrorMessage());
    return Outcome<void>::error(ErrorKind::StoreUnavailable,
                                Constants::Errors::STORE_WRITE_FAILED + juce::String(": ") + result.getErrorMessage());
  }

  Util::logDebug(kCategory, "Created preferences directory", "path=" + directory.getFullPathName());
  return Outcome<void>::ok();
}

//==============================================================================

Outcome<PreferenceSet> FilePreferenceStore::load(const juce::String &profileId) {
  using Result = Outcome<PreferenceSet>;

  auto idCheck = checkProfileId(profileId);
  if (idCheck.isError())
    return Result::error(idCheck.getErrorKind(), idCheck.getError());

  auto file = getProfileFile(profileId);
  if (!file.exists()) {
    Util::logDebug(kCategory, "No stored preferences, starting empty", "profile=" + profileId);
    return Result::ok(PreferenceSet{});
  }

  juce::FileInputStream in(file);
  if (in.failedToOpen()) {
    auto reason = in.getStatus().getErrorMessage();
    Util::logError(kCategory, "Failed to open preferences", "profile=" + profileId + " error=" + reason);
    return Result::error(ErrorKind::StoreUnavailable,
                         Constants::Errors::STORE_READ_FAILED + juce::String(": ") + reason);
  }

  auto text = in.readEntireStreamAsString();
  auto json = nlohmann::json::parse(text.toStdString(), nullptr, false);
  if (json.is_discarded()) {
    Util::logError(kCategory, "Preferences file is not valid JSON", "path=" + file.getFullPathName());
    return Result::error(ErrorKind::StoreUnavailable, Constants::Errors::STORE_CORRUPT);
  }

  try {
    auto prefs = PreferenceSet::fromJson(json);
    Util::logDebug(kCategory, "Loaded preferences",
                   "profile=" + profileId + " preferred=" + juce::String(static_cast<int>(prefs.preferred.size())) +
                       " blocked=" + juce::String(static_cast<int>(prefs.blocked.size())));
    return Result::ok(std::move(prefs));
  } catch (const Json::ValidationError &e) {
    Util::logError(kCategory, "Preferences file failed validation", e.what());
    return Result::error(ErrorKind::StoreUnavailable,
                         Constants::Errors::STORE_CORRUPT + juce::String(": ") + juce::String(e.what()));
  }
}

Outcome<void> FilePreferenceStore::save(const juce::String &profileId, const PreferenceSet &prefs) {
  auto idCheck = checkProfileId(profileId);
  if (idCheck.isError())
    return idCheck;

  auto dirResult = ensureDirectory();
  if (dirResult.isError())
    return dirResult;

  auto file = getProfileFile(profileId);
  auto text = juce::String(prefs.toJson().dump(2)) + "\n";

  juce::TemporaryFile temp(file, juce::TemporaryFile::useHiddenFile);
  {
    juce::FileOutputStream out(temp.getFile());
    if (out.failedToOpen()) {
      Util::logError(kCategory, "Failed to open temporary file", out.getStatus().getErrorMessage());
      return Outcome<void>::error(ErrorKind::StoreUnavailable, Constants::Errors::STORE_WRITE_FAILED + juce::String(": ") +
                                                                   out.getStatus().getErrorMessage());
    }

    if (!out.writeText(text, false, false, nullptr)) {
      Util::logError(kCategory, "Failed to write temporary file", "path=" + temp.getFile().getFullPathName());
      return Outcome<void>::error(ErrorKind::StoreUnavailable, Constants::Errors::STORE_WRITE_FAILED);
    }

    out.flush();
    if (out.getStatus().failed()) {
      Util::logError(kCategory, "Failed to flush temporary file", out.getStatus().getErrorMessage());
      return Outcome<void>::error(ErrorKind::StoreUnavailable, Constants::Errors::STORE_WRITE_FAILED + juce::String(": ") +
                                                                   out.getStatus().getErrorMessage());
    }
  }

  if (!temp.overwriteTargetFileWithTemporary()) {
    Util::logError(kCategory, "Failed to replace preferences file", "path=" + file.getFullPathName());
    return Outcome<void>::error(ErrorKind::StoreUnavailable, Constants::Errors::STORE_WRITE_FAILED);
  }

  Util::logDebug(kCategory, "Saved preferences", "profile=" + profileId);
  return Outcome<void>::ok();
}

} // namespace Stores
} // namespace Feedwise

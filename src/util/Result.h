#pragma once

#include "logging/Logger.h"
#include <JuceHeader.h>
#include <functional>
#include <optional>

namespace Feedwise {

//==============================================================================
/**
 * ErrorKind - Classification of recoverable engine failures
 *
 * - InvalidTopic:     malformed topic text (empty or no letters/digits)
 * - InvalidProfile:   empty profile id
 * - StoreUnavailable: preference storage could not be read or written
 * - Unknown:          anything else (never produced by the engine itself)
 */
enum class ErrorKind { None, InvalidTopic, InvalidProfile, StoreUnavailable, Unknown };

inline const char *errorKindToString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "None";
  case ErrorKind::InvalidTopic:
    return "InvalidTopic";
  case ErrorKind::InvalidProfile:
    return "InvalidProfile";
  case ErrorKind::StoreUnavailable:
    return "StoreUnavailable";
  default:
    return "Unknown";
  }
}

//==============================================================================
/**
 * Outcome<T> - A type-safe error handling utility
 *
 * Carries either a value or an error (kind + human readable message).
 * Engine operations return Outcome instead of throwing so that UI call
 * paths never see exceptions.
 *
 * Usage:
 *   Outcome<Topic> parseTopic(const juce::String& text) {
 *       Topic topic(text);
 *       if (!topic.isValid())
 *           return Outcome<Topic>::error(ErrorKind::InvalidTopic, "Topic has no letters or digits");
 *       return Outcome<Topic>::ok(topic);
 *   }
 *
 *   auto result = registry.addBlocked(profileId, "ASMR");
 *   if (result.isError() && result.getErrorKind() == ErrorKind::InvalidTopic)
 *       showInlineHint(result.getError());
 */
template <typename T> class Outcome {
public:
  //==========================================================================
  // Factory methods

  /** Create a successful result with a value */
  static Outcome<T> ok(const T &value) {
    return Outcome<T>(value);
  }

  /** Create a successful result with a moved value */
  static Outcome<T> ok(T &&value) {
    return Outcome<T>(std::move(value));
  }

  /** Create a failed result */
  static Outcome<T> error(ErrorKind kind, const juce::String &message) {
    return Outcome<T>(kind, message);
  }

  /** Create a failed result of unknown kind */
  static Outcome<T> error(const juce::String &message) {
    return Outcome<T>(ErrorKind::Unknown, message);
  }

  //==========================================================================
  // State checking

  bool isOk() const noexcept {
    return value.has_value();
  }

  bool isError() const noexcept {
    return !value.has_value();
  }

  explicit operator bool() const noexcept {
    return value.has_value();
  }

  //==========================================================================
  // Value access

  /**
   * Get the value. Only call if isOk() returns true.
   * Logs an error and returns a default T if called on an error result.
   */
  const T &getValue() const {
    if (!value.has_value()) {
      Util::logError("Outcome", "getValue() called on error result", errorMessage);
      static const T defaultValue{};
      return defaultValue;
    }
    return *value;
  }

  T getValueOr(const T &defaultValue) const {
    return value.has_value() ? *value : defaultValue;
  }

  const juce::String &getError() const noexcept {
    return errorMessage;
  }

  ErrorKind getErrorKind() const noexcept {
    return kind;
  }

  //==========================================================================
  // Monadic operations

  template <typename U> Outcome<U> map(std::function<U(const T &)> fn) const {
    if (value.has_value())
      return Outcome<U>::ok(fn(*value));
    return Outcome<U>::error(kind, errorMessage);
  }

  const Outcome<T> &onError(std::function<void(ErrorKind, const juce::String &)> fn) const {
    if (!value.has_value())
      fn(kind, errorMessage);
    return *this;
  }

private:
  explicit Outcome(const T &val) : value(val) {}
  explicit Outcome(T &&val) : value(std::move(val)) {}
  Outcome(ErrorKind errorKind, const juce::String &error)
      : errorMessage(error), kind(errorKind == ErrorKind::None ? ErrorKind::Unknown : errorKind) {}

  std::optional<T> value;
  juce::String errorMessage;
  ErrorKind kind = ErrorKind::None;
};

//==============================================================================
/**
 * Outcome<void> specialization for operations that don't return a value.
 */
template <> class Outcome<void> {
public:
  static Outcome<void> ok() {
    return Outcome<void>(ErrorKind::None, {});
  }

  static Outcome<void> error(ErrorKind kind, const juce::String &message) {
    return Outcome<void>(kind == ErrorKind::None ? ErrorKind::Unknown : kind, message);
  }

  bool isOk() const noexcept {
    return kind == ErrorKind::None;
  }
  bool isError() const noexcept {
    return kind != ErrorKind::None;
  }
  explicit operator bool() const noexcept {
    return isOk();
  }

  const juce::String &getError() const noexcept {
    return errorMessage;
  }

  ErrorKind getErrorKind() const noexcept {
    return kind;
  }

  const Outcome<void> &onError(std::function<void(ErrorKind, const juce::String &)> fn) const {
    if (isError())
      fn(kind, errorMessage);
    return *this;
  }

  /**
   * Chain another operation if this one succeeded.
   */
  template <typename U> Outcome<U> then(std::function<Outcome<U>()> fn) const {
    if (isOk())
      return fn();
    return Outcome<U>::error(kind, errorMessage);
  }

private:
  Outcome(ErrorKind errorKind, const juce::String &error) : errorMessage(error), kind(errorKind) {}

  juce::String errorMessage;
  ErrorKind kind = ErrorKind::None;
};

} // namespace Feedwise

#pragma once

#include <JuceHeader.h>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace Feedwise {
namespace Json {

// ==============================================================================
/**
 * ValidationError - JSON validation exception with detailed error context
 *
 * Thrown from from_json() implementations when a field has the wrong type or
 * a required field is missing. Callers at storage/CLI boundaries catch it and
 * convert to an Outcome error; it never escapes the engine API.
 */
class ValidationError : public std::runtime_error {
public:
  ValidationError(const std::string &field, const std::string &reason, const std::string &context = "")
      : std::runtime_error("JSON validation failed for field '" + field + "': " + reason +
                           (context.empty() ? "" : " (context: " + context + ")")) {}
};

// ==============================================================================
// Required field validation

/**
 * Require a field to exist and have the correct type
 * @throws ValidationError if field is missing or has wrong type
 */
template <typename T> T require(const nlohmann::json &j, const std::string &field) {
  if (!j.contains(field)) {
    throw ValidationError(field, "required field is missing", j.dump());
  }
  try {
    return j.at(field).get<T>();
  } catch (const nlohmann::json::exception &e) {
    throw ValidationError(field, "type mismatch - " + std::string(e.what()), j.dump());
  }
}

// ==============================================================================
// Optional field with default value

/**
 * Get an optional field with a default value
 * @throws ValidationError if field exists but has wrong type
 */
template <typename T> T optional(const nlohmann::json &j, const std::string &field, const T &defaultValue) {
  if (!j.contains(field) || j.at(field).is_null()) {
    return defaultValue;
  }
  try {
    return j.at(field).get<T>();
  } catch (const nlohmann::json::exception &e) {
    throw ValidationError(field, "type mismatch - " + std::string(e.what()), j.dump());
  }
}

// ==============================================================================
// String conversion utilities

inline juce::String toJuceString(const std::string &str) {
  return juce::String::fromUTF8(str.c_str(), static_cast<int>(str.size()));
}

inline std::string fromJuceString(const juce::String &str) {
  return str.toStdString();
}

/**
 * Read an optional array of strings. Missing or null yields an empty array;
 * non-string elements are a type mismatch.
 */
inline juce::StringArray optionalStringArray(const nlohmann::json &j, const std::string &field) {
  juce::StringArray result;
  if (!j.contains(field) || j.at(field).is_null())
    return result;

  const auto &array = j.at(field);
  if (!array.is_array())
    throw ValidationError(field, "expected array", j.dump());

  for (const auto &element : array) {
    if (!element.is_string())
      throw ValidationError(field, "expected array of strings", array.dump());
    result.add(toJuceString(element.get<std::string>()));
  }
  return result;
}

inline nlohmann::json toJsonArray(const juce::StringArray &strings) {
  auto array = nlohmann::json::array();
  for (const auto &s : strings)
    array.push_back(fromJuceString(s));
  return array;
}

// ==============================================================================
/**
 * FEEDWISE_JSON_TYPE - Generate JSON serialization methods for a type
 *
 * Usage:
 *   struct MyModel {
 *     juce::String id;
 *     FEEDWISE_JSON_TYPE(MyModel)
 *   };
 *
 *   void to_json(nlohmann::json& j, const MyModel& m) { ... }
 *   void from_json(const nlohmann::json& j, MyModel& m) { ... }
 *
 * This generates:
 *   - static MyModel fromJson(const nlohmann::json& j)
 *   - nlohmann::json toJson() const
 */
#define FEEDWISE_JSON_TYPE(Type)                                                                                       \
  friend void to_json(nlohmann::json &j, const Type &obj);                                                             \
  friend void from_json(const nlohmann::json &j, Type &obj);                                                           \
  static Type fromJson(const nlohmann::json &j) {                                                                      \
    try {                                                                                                              \
      Type obj;                                                                                                        \
      from_json(j, obj);                                                                                               \
      return obj;                                                                                                      \
    } catch (const Feedwise::Json::ValidationError &) {                                                                \
      throw;                                                                                                           \
    } catch (const std::exception &e) {                                                                                \
      throw Feedwise::Json::ValidationError("unknown", e.what(), j.dump());                                            \
    }                                                                                                                  \
  }                                                                                                                    \
  nlohmann::json toJson() const {                                                                                      \
    nlohmann::json j;                                                                                                  \
    to_json(j, *this);                                                                                                 \
    return j;                                                                                                          \
  }

} // namespace Json
} // namespace Feedwise

// ==============================================================================
// Helper macros for common patterns in from_json implementations

#define JSON_REQUIRE(json, field, var) var = Feedwise::Json::require<decltype(var)>(json, field)

#define JSON_OPTIONAL(json, field, var, defaultVal)                                                                    \
  var = Feedwise::Json::optional<decltype(var)>(json, field, defaultVal)

#define JSON_REQUIRE_STRING(json, field, var)                                                                          \
  var = Feedwise::Json::toJuceString(Feedwise::Json::require<std::string>(json, field))

#define JSON_OPTIONAL_STRING(json, field, var, defaultVal)                                                             \
  var = Feedwise::Json::toJuceString(Feedwise::Json::optional<std::string>(json, field, defaultVal))

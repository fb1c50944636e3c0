/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <mutex>
#include <map>
#include <string>

#include <eta/helpers/Rapidjson.hpp>

namespace eta {

using std::string;

/// The kinds of values an Attribute can hold.
enum class AttributeType {
  Undefined = 0, ///< Unset, default-constructed attributes & schemas.
  Categorical, ///< A string, out of a set of categories.
  Numeric, ///< A 64 bit float.
  Boolean, ///< True or false.
  COUNT ///< Not a valid value: number of valid AttributeType values.
};

/// Get a human readable name for an attribute type: "Categorical", "Numeric", "Boolean".
string toString(AttributeType type);

/// Get the discriminator saved in json documents to identify an attribute type.
/// For instance, "eta.core.data.NumericAttribute".
/// @return The canonical discriminator, or an empty string for invalid types.
string getAttributeDiscriminator(AttributeType type);

/// Tagged value of an Attribute. Only the field matching the type is meaningful.
struct AttributeValue {
  AttributeValue() = default;
  explicit AttributeValue(const string& categoricalValue)
      : type{AttributeType::Categorical}, categorical{categoricalValue} {}
  explicit AttributeValue(const char* categoricalValue)
      : type{AttributeType::Categorical}, categorical{categoricalValue} {}
  explicit AttributeValue(double numericValue)
      : type{AttributeType::Numeric}, numeric{numericValue} {}
  explicit AttributeValue(bool booleanValue)
      : type{AttributeType::Boolean}, boolean{booleanValue} {}

  bool operator==(const AttributeValue& rhs) const;
  bool operator!=(const AttributeValue& rhs) const {
    return !operator==(rhs);
  }

  /// Text representation of the value, for logging.
  string asString() const;

  /// False for NaN & infinite numeric values, which no schema range can hold.
  bool isFinite() const;

  AttributeType type{AttributeType::Undefined};
  string categorical;
  double numeric{0};
  bool boolean{false};
};

/// \brief A named, typed value, with an optional confidence.
///
/// Attributes are values: once built, their name, type & value don't change.
/// The confidence isn't range checked.
class Attribute {
 public:
  Attribute() = default;

  static Attribute makeCategorical(const string& name, const string& value);
  static Attribute makeCategorical(const string& name, const string& value, double confidence);
  static Attribute makeNumeric(const string& name, double value);
  static Attribute makeNumeric(const string& name, double value, double confidence);
  static Attribute makeBoolean(const string& name, bool value);
  static Attribute makeBoolean(const string& name, bool value, double confidence);

  /// Build an attribute of a given type from a raw text value.
  /// Categorical attributes keep the text unchanged. Numeric attributes require a number.
  /// Boolean attributes coerce the text: "", "0", "false", "no", "off" & "none" are false.
  /// @param type: the attribute's type.
  /// @param name: the attribute's name.
  /// @param rawValue: the text to interpret.
  /// @param outAttribute: on success, the attribute built. Unchanged on failure.
  /// @return 0 on success, VALUE_PARSE_ERROR if the text isn't a number for a numeric type,
  /// or UNKNOWN_VARIANT for an invalid type.
  static int parse(
      AttributeType type,
      const string& name,
      const string& rawValue,
      Attribute& outAttribute);
  /// Same as above, with a confidence.
  static int parse(
      AttributeType type,
      const string& name,
      const string& rawValue,
      double confidence,
      Attribute& outAttribute);

  AttributeType getType() const {
    return value_.type;
  }
  const string& getName() const {
    return name_;
  }
  const AttributeValue& getValue() const {
    return value_;
  }
  const string& getCategoricalValue() const {
    return value_.categorical;
  }
  double getNumericValue() const {
    return value_.numeric;
  }
  bool getBooleanValue() const {
    return value_.boolean;
  }

  bool hasConfidence() const {
    return hasConfidence_;
  }
  /// @return The confidence, or 0 if there is none.
  double getConfidence() const {
    return hasConfidence_ ? confidence_ : 0;
  }

  bool operator==(const Attribute& rhs) const;
  bool operator!=(const Attribute& rhs) const {
    return !operator==(rhs);
  }

  /// Add the json members of this attribute to a json object.
  void serialize(JsonWrapper& rj) const;
  /// Convert to a json document: {"type", "name", "value", "confidence"?}
  string toJson(JsonFormat format = JsonFormat::Compact) const;

  /// Rebuild an attribute from its json form. The "type" discriminator picks the variant.
  /// @return 0 on success, UNKNOWN_VARIANT if the discriminator isn't registered,
  /// INVALID_JSON if members are missing, VALUE_PARSE_ERROR if the value doesn't fit the type.
  static int fromJValue(const JValue& jattribute, Attribute& outAttribute);
  static int fromJson(const string& json, Attribute& outAttribute);

 private:
  Attribute(const string& name, const AttributeValue& value) : name_{name}, value_{value} {}
  Attribute& setConfidence(double confidence) {
    hasConfidence_ = true;
    confidence_ = confidence;
    return *this;
  }

  string name_;
  AttributeValue value_;
  bool hasConfidence_{false};
  double confidence_{0};
};

/// \brief Registry of the json discriminators that identify attribute types.
///
/// The canonical discriminators of each type are registered at construction.
/// Applications may register aliases, for instance to read documents produced by another
/// version of their data.
/// This class is thread-safe.
class AttributeTypeRegistry {
 public:
  static AttributeTypeRegistry& get();

  /// Register a discriminator for an attribute type. Re-registering a discriminator replaces it.
  /// @return 0 on success, INVALID_PARAMETER if the discriminator is empty or the type invalid.
  int registerType(const string& discriminator, AttributeType type);

  /// Find the attribute type of a discriminator.
  /// @return 0 on success, UNKNOWN_VARIANT if the discriminator isn't registered.
  int getType(const string& discriminator, AttributeType& outType);

  bool isRegistered(const string& discriminator);

 protected:
  AttributeTypeRegistry();

 private:
  std::mutex mutex_;
  std::map<string, AttributeType> types_;
};

} // namespace eta

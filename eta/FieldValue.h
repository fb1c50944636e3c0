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

#include <cstdint>

#include <string>

#include <eta/helpers/Rapidjson.hpp>

namespace eta {

using std::string;

enum class FieldType {
  Null = 0,
  Bool,
  Int,
  Double,
  String,
  Json, ///< A json array or object, kept as compact json text.
  COUNT
};

string toString(FieldType type);

/// \brief The value of a record field: any json value.
///
/// Field values are ordered and comparable, so they can be used as keys of maps & sets.
/// Ints and doubles are compared as numbers, so that 2 and 2.0 are the same key.
/// Values of different kinds are ordered by kind: null < bool < number < string < json.
class FieldValue {
 public:
  FieldValue() = default;
  FieldValue(bool value) : type_{FieldType::Bool}, bool_{value} {}
  FieldValue(int value) : type_{FieldType::Int}, int_{value} {}
  FieldValue(int64_t value) : type_{FieldType::Int}, int_{value} {}
  FieldValue(double value) : type_{FieldType::Double}, double_{value} {}
  FieldValue(const char* value) : type_{FieldType::String}, string_{value} {}
  FieldValue(const string& value) : type_{FieldType::String}, string_{value} {}

  /// Make a value from json text. Scalars are converted to their natural type.
  /// @return 0 on success, INVALID_JSON if the text isn't json.
  static int fromJson(const string& json, FieldValue& outValue);
  static FieldValue fromJValue(const JValue& jvalue);

  FieldType getType() const {
    return type_;
  }
  bool isNull() const {
    return type_ == FieldType::Null;
  }
  bool isNumber() const {
    return type_ == FieldType::Int || type_ == FieldType::Double;
  }
  bool getBool() const {
    return bool_;
  }
  int64_t getInt() const {
    return type_ == FieldType::Double ? static_cast<int64_t>(double_) : int_;
  }
  double getDouble() const {
    return type_ == FieldType::Int ? static_cast<double>(int_) : double_;
  }
  /// The text of a string, or the json text of an array or an object.
  const string& getString() const {
    return string_;
  }

  /// Human readable form, for logs & messages: strings are not quoted.
  string asString() const;
  /// Compact json form.
  string toJson() const;

  JValue toJValue(JDocument::AllocatorType& alloc) const;

  /// Three way comparison: negative, 0, or positive.
  /// Types are ordered null, bool, number, string, json. Ints & doubles compare by exact value,
  /// and NaN is after every other number, so FieldValue can be a set or map key.
  int compare(const FieldValue& rhs) const;

  bool operator==(const FieldValue& rhs) const {
    return compare(rhs) == 0;
  }
  bool operator!=(const FieldValue& rhs) const {
    return compare(rhs) != 0;
  }
  bool operator<(const FieldValue& rhs) const {
    return compare(rhs) < 0;
  }

 private:
  FieldType type_{FieldType::Null};
  bool bool_{false};
  int64_t int_{0};
  double double_{0};
  string string_;
};

} // namespace eta

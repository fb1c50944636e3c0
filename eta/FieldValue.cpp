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

#include <eta/FieldValue.h>

#include <cmath>

#include <fmt/format.h>

#define DEFAULT_LOG_CHANNEL "FieldValue"
#include <logging/Log.h>

#include <eta/ErrorCode.h>
#include <eta/helpers/Strings.h>

using namespace std;

namespace {

const char* sFieldTypeNames[] = {"null", "bool", "int", "double", "string", "json"};
static_assert(
    sizeof(sFieldTypeNames) / sizeof(sFieldTypeNames[0]) ==
        static_cast<size_t>(eta::FieldType::COUNT),
    "Missing FieldType name definitions");

// Ints & doubles share the same rank, so they compare as numbers
int typeRank(eta::FieldType type) {
  switch (type) {
    case eta::FieldType::Null:
      return 0;
    case eta::FieldType::Bool:
      return 1;
    case eta::FieldType::Int:
    case eta::FieldType::Double:
      return 2;
    case eta::FieldType::String:
      return 3;
    case eta::FieldType::Json:
    case eta::FieldType::COUNT:
      break;
  }
  return 4;
}

template <class T>
int compareValues(const T& left, const T& right) {
  return left < right ? -1 : (right < left ? 1 : 0);
}

// NaN is after every other number, and equal to itself
int compareDoubles(double left, double right) {
  bool leftNan = std::isnan(left);
  bool rightNan = std::isnan(right);
  if (leftNan || rightNan) {
    return leftNan == rightNan ? 0 : (leftNan ? 1 : -1);
  }
  return compareValues(left, right);
}

// Exact, without converting the int to a double, which would round values above 2^53
int compareIntDouble(int64_t left, double right) {
  const double kTwoPow63 = 9223372036854775808.0;
  if (std::isnan(right) || right >= kTwoPow63) {
    return -1;
  }
  if (right < -kTwoPow63) {
    return 1;
  }
  double floored = std::floor(right);
  int64_t rightFloor = static_cast<int64_t>(floored);
  if (left != rightFloor) {
    return left < rightFloor ? -1 : 1;
  }
  return floored < right ? -1 : 0;
}

} // namespace

namespace eta {

string toString(FieldType type) {
  size_t index = static_cast<size_t>(type);
  return index < static_cast<size_t>(FieldType::COUNT) ? sFieldTypeNames[index] : "<Invalid>";
}

int FieldValue::fromJson(const string& json, FieldValue& outValue) {
  JDocument doc;
  if (!jParse(doc, json)) {
    ETA_LOGW("Invalid json value: {}", helpers::make_printable(json));
    return INVALID_JSON;
  }
  outValue = fromJValue(doc);
  return SUCCESS;
}

FieldValue FieldValue::fromJValue(const JValue& jvalue) {
  if (jvalue.IsBool()) {
    return FieldValue(jvalue.GetBool());
  }
  if (jvalue.IsInt64()) {
    return FieldValue(static_cast<int64_t>(jvalue.GetInt64()));
  }
  if (jvalue.IsNumber()) {
    return FieldValue(jvalue.GetDouble());
  }
  if (jvalue.IsString()) {
    return FieldValue(string(jvalue.GetString(), jvalue.GetStringLength()));
  }
  FieldValue value;
  if (jvalue.IsArray() || jvalue.IsObject()) {
    value.type_ = FieldType::Json;
    value.string_ = jToJsonString(jvalue);
  }
  return value;
}

string FieldValue::asString() const {
  switch (type_) {
    case FieldType::Null:
      return "null";
    case FieldType::Bool:
      return bool_ ? "true" : "false";
    case FieldType::Int:
      return fmt::format("{}", int_);
    case FieldType::Double:
      return fmt::format("{}", double_);
    case FieldType::String:
    case FieldType::Json:
      return string_;
    case FieldType::COUNT:
      break;
  }
  return {};
}

string FieldValue::toJson() const {
  JDocument doc;
  JValue value = toJValue(doc.GetAllocator());
  return jToJsonString(value);
}

JValue FieldValue::toJValue(JDocument::AllocatorType& alloc) const {
  JValue value;
  switch (type_) {
    case FieldType::Bool:
      value.SetBool(bool_);
      break;
    case FieldType::Int:
      value.SetInt64(int_);
      break;
    case FieldType::Double:
      value.SetDouble(double_);
      break;
    case FieldType::String:
      value.SetString(string_.c_str(), static_cast<eta_rapidjson::SizeType>(string_.size()), alloc);
      break;
    case FieldType::Json: {
      JDocument doc;
      if (jParse(doc, string_)) {
        value.CopyFrom(doc, alloc);
      }
      break;
    }
    case FieldType::Null:
    case FieldType::COUNT:
      break;
  }
  return value;
}

int FieldValue::compare(const FieldValue& rhs) const {
  int leftRank = typeRank(type_);
  int rightRank = typeRank(rhs.type_);
  if (leftRank != rightRank) {
    return leftRank < rightRank ? -1 : 1;
  }
  switch (type_) {
    case FieldType::Null:
      return 0;
    case FieldType::Bool:
      return compareValues(bool_, rhs.bool_);
    case FieldType::Int:
    case FieldType::Double:
      if (type_ == FieldType::Int) {
        return rhs.type_ == FieldType::Int ? compareValues(int_, rhs.int_)
                                           : compareIntDouble(int_, rhs.double_);
      }
      return rhs.type_ == FieldType::Int ? -compareIntDouble(rhs.int_, double_)
                                         : compareDoubles(double_, rhs.double_);
    case FieldType::String:
    case FieldType::Json:
    case FieldType::COUNT:
      break;
  }
  return string_.compare(rhs.string_) < 0 ? -1 : (string_ == rhs.string_ ? 0 : 1);
}

} // namespace eta

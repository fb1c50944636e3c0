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

#include <eta/Attribute.h>

#include <cmath>

#include <fmt/format.h>

#define DEFAULT_LOG_CHANNEL "Attribute"
#include <logging/Log.h>

#include <eta/ErrorCode.h>
#include <eta/helpers/FileMacros.h>
#include <eta/helpers/Strings.h>

using namespace std;

namespace {

const char* sTypeNames[] = {"Undefined", "Categorical", "Numeric", "Boolean"};
static_assert(
    sizeof(sTypeNames) / sizeof(sTypeNames[0]) == static_cast<size_t>(eta::AttributeType::COUNT),
    "Missing AttributeType name definitions");

const char* sDiscriminators[] = {
    "",
    "eta.core.data.CategoricalAttribute",
    "eta.core.data.NumericAttribute",
    "eta.core.data.BooleanAttribute"};
static_assert(
    sizeof(sDiscriminators) / sizeof(sDiscriminators[0]) ==
        static_cast<size_t>(eta::AttributeType::COUNT),
    "Missing AttributeType discriminator definitions");

bool isValidType(eta::AttributeType type) {
  return type > eta::AttributeType::Undefined && type < eta::AttributeType::COUNT;
}

} // namespace

namespace eta {

string toString(AttributeType type) {
  size_t index = static_cast<size_t>(type);
  return index < static_cast<size_t>(AttributeType::COUNT) ? sTypeNames[index] : "<Invalid>";
}

string getAttributeDiscriminator(AttributeType type) {
  return isValidType(type) ? sDiscriminators[static_cast<size_t>(type)] : "";
}

bool AttributeValue::operator==(const AttributeValue& rhs) const {
  if (type != rhs.type) {
    return false;
  }
  switch (type) {
    case AttributeType::Categorical:
      return categorical == rhs.categorical;
    case AttributeType::Numeric:
      return numeric == rhs.numeric;
    case AttributeType::Boolean:
      return boolean == rhs.boolean;
    case AttributeType::Undefined:
    case AttributeType::COUNT:
      break;
  }
  return true;
}

string AttributeValue::asString() const {
  switch (type) {
    case AttributeType::Categorical:
      return categorical;
    case AttributeType::Numeric:
      return fmt::format("{}", numeric);
    case AttributeType::Boolean:
      return boolean ? "true" : "false";
    case AttributeType::Undefined:
    case AttributeType::COUNT:
      break;
  }
  return "<undefined>";
}

bool AttributeValue::isFinite() const {
  return type != AttributeType::Numeric || std::isfinite(numeric);
}

Attribute Attribute::makeCategorical(const string& name, const string& value) {
  return Attribute(name, AttributeValue(value));
}

Attribute Attribute::makeCategorical(const string& name, const string& value, double confidence) {
  return makeCategorical(name, value).setConfidence(confidence);
}

Attribute Attribute::makeNumeric(const string& name, double value) {
  return Attribute(name, AttributeValue(value));
}

Attribute Attribute::makeNumeric(const string& name, double value, double confidence) {
  return makeNumeric(name, value).setConfidence(confidence);
}

Attribute Attribute::makeBoolean(const string& name, bool value) {
  return Attribute(name, AttributeValue(value));
}

Attribute Attribute::makeBoolean(const string& name, bool value, double confidence) {
  return makeBoolean(name, value).setConfidence(confidence);
}

int Attribute::parse(
    AttributeType type,
    const string& name,
    const string& rawValue,
    Attribute& outAttribute) {
  switch (type) {
    case AttributeType::Categorical:
      outAttribute = makeCategorical(name, rawValue);
      return SUCCESS;
    case AttributeType::Numeric: {
      double value = 0;
      if (!helpers::readDouble(rawValue, value)) {
        ETA_LOGW("Value '{}' of attribute '{}' isn't a number", rawValue, name);
        return VALUE_PARSE_ERROR;
      }
      outAttribute = makeNumeric(name, value);
      return SUCCESS;
    }
    case AttributeType::Boolean:
      outAttribute = makeBoolean(name, helpers::readBool(rawValue));
      return SUCCESS;
    case AttributeType::Undefined:
    case AttributeType::COUNT:
      break;
  }
  return UNKNOWN_VARIANT;
}

int Attribute::parse(
    AttributeType type,
    const string& name,
    const string& rawValue,
    double confidence,
    Attribute& outAttribute) {
  Attribute attribute;
  IF_ERROR_RETURN(parse(type, name, rawValue, attribute));
  outAttribute = attribute.setConfidence(confidence);
  return SUCCESS;
}

bool Attribute::operator==(const Attribute& rhs) const {
  return name_ == rhs.name_ && value_ == rhs.value_ && hasConfidence_ == rhs.hasConfidence_ &&
      (!hasConfidence_ || confidence_ == rhs.confidence_);
}

void Attribute::serialize(JsonWrapper& rj) const {
  rj.addMember("type", getAttributeDiscriminator(getType()));
  rj.addMember("name", name_);
  switch (getType()) {
    case AttributeType::Categorical:
      rj.addMember("value", value_.categorical);
      break;
    case AttributeType::Numeric:
      rj.addMember("value", value_.numeric);
      break;
    case AttributeType::Boolean:
      rj.addMember("value", value_.boolean);
      break;
    case AttributeType::Undefined:
    case AttributeType::COUNT:
      break;
  }
  if (hasConfidence_) {
    rj.addMember("confidence", confidence_);
  }
}

string Attribute::toJson(JsonFormat format) const {
  JDocument doc;
  JsonWrapper rj{doc};
  serialize(rj);
  return jDocumentToJsonString(doc, format);
}

namespace {

int readCategoricalValue(const JValue& jvalue, string& outValue) {
  if (jvalue.IsString()) {
    outValue.assign(jvalue.GetString(), jvalue.GetStringLength());
    return SUCCESS;
  }
  if (jvalue.IsNumber() || jvalue.IsBool()) {
    outValue = jToJsonString(jvalue);
    return SUCCESS;
  }
  return VALUE_PARSE_ERROR;
}

int readNumericValue(const JValue& jvalue, double& outValue) {
  if (jvalue.IsNumber()) {
    if (!std::isfinite(jvalue.GetDouble())) {
      return VALUE_PARSE_ERROR;
    }
    outValue = jvalue.GetDouble();
    return SUCCESS;
  }
  if (jvalue.IsString() && helpers::readDouble(jvalue.GetString(), outValue)) {
    return SUCCESS;
  }
  return VALUE_PARSE_ERROR;
}

int readBooleanValue(const JValue& jvalue, bool& outValue) {
  if (jvalue.IsBool()) {
    outValue = jvalue.GetBool();
  } else if (jvalue.IsNumber()) {
    outValue = jvalue.GetDouble() != 0;
  } else if (jvalue.IsString()) {
    outValue = helpers::readBool(jvalue.GetString());
  } else if (jvalue.IsNull()) {
    outValue = false;
  } else {
    return VALUE_PARSE_ERROR;
  }
  return SUCCESS;
}

} // namespace

int Attribute::fromJValue(const JValue& jattribute, Attribute& outAttribute) {
  string discriminator;
  if (!getJString(discriminator, jattribute, "type")) {
    ETA_LOGW("Attribute has no type discriminator");
    return INVALID_JSON;
  }
  AttributeType type = AttributeType::Undefined;
  if (AttributeTypeRegistry::get().getType(discriminator, type) != SUCCESS) {
    ETA_LOGW("Unknown attribute type '{}'", discriminator);
    return UNKNOWN_VARIANT;
  }
  string name;
  if (!getJString(name, jattribute, "name")) {
    ETA_LOGW("Attribute of type '{}' has no name", discriminator);
    return INVALID_JSON;
  }
  const JValue* jvalue = findJMember(jattribute, "value");
  if (jvalue == nullptr) {
    ETA_LOGW("Attribute '{}' has no value", name);
    return INVALID_JSON;
  }
  const JValue* jconfidence = findJMember(jattribute, "confidence");
  if (jconfidence != nullptr && !jconfidence->IsNull() && !jconfidence->IsNumber()) {
    ETA_LOGW("Attribute '{}' has an invalid confidence", name);
    return INVALID_JSON;
  }
  Attribute attribute;
  int status = VALUE_PARSE_ERROR;
  switch (type) {
    case AttributeType::Categorical: {
      string value;
      status = readCategoricalValue(*jvalue, value);
      attribute = makeCategorical(name, value);
      break;
    }
    case AttributeType::Numeric: {
      double value = 0;
      status = readNumericValue(*jvalue, value);
      attribute = makeNumeric(name, value);
      break;
    }
    case AttributeType::Boolean: {
      bool value = false;
      status = readBooleanValue(*jvalue, value);
      attribute = makeBoolean(name, value);
      break;
    }
    case AttributeType::Undefined:
    case AttributeType::COUNT:
      status = UNKNOWN_VARIANT;
      break;
  }
  if (status != SUCCESS) {
    ETA_LOGW("Invalid value for {} attribute '{}'", toString(type), name);
    return status;
  }
  if (jconfidence != nullptr && jconfidence->IsNumber()) {
    attribute.setConfidence(jconfidence->GetDouble());
  }
  outAttribute = attribute;
  return SUCCESS;
}

int Attribute::fromJson(const string& json, Attribute& outAttribute) {
  JDocument doc;
  if (!jParse(doc, json) || !doc.IsObject()) {
    ETA_LOGW("Invalid attribute json: {}", helpers::make_printable(json));
    return INVALID_JSON;
  }
  return fromJValue(doc, outAttribute);
}

AttributeTypeRegistry& AttributeTypeRegistry::get() {
  static AttributeTypeRegistry sInstance;
  return sInstance;
}

AttributeTypeRegistry::AttributeTypeRegistry() {
  for (size_t index = 1; index < static_cast<size_t>(AttributeType::COUNT); ++index) {
    types_[sDiscriminators[index]] = static_cast<AttributeType>(index);
  }
}

int AttributeTypeRegistry::registerType(const string& discriminator, AttributeType type) {
  if (discriminator.empty() || !isValidType(type)) {
    return INVALID_PARAMETER;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  types_[discriminator] = type;
  return SUCCESS;
}

int AttributeTypeRegistry::getType(const string& discriminator, AttributeType& outType) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto iter = types_.find(discriminator);
  if (iter == types_.end()) {
    return UNKNOWN_VARIANT;
  }
  outType = iter->second;
  return SUCCESS;
}

bool AttributeTypeRegistry::isRegistered(const string& discriminator) {
  std::lock_guard<std::mutex> lock(mutex_);
  return types_.find(discriminator) != types_.end();
}

} // namespace eta

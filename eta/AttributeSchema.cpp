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

#include <eta/AttributeSchema.h>

#include <algorithm>
#include <cmath>
#include <mutex>
#include <vector>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#define DEFAULT_LOG_CHANNEL "AttributeSchema"
#include <logging/Log.h>

#include <eta/ErrorCode.h>
#include <eta/helpers/FileMacros.h>
#include <eta/helpers/Strings.h>

using namespace std;

namespace {

string makeUuid() {
  static boost::uuids::random_generator sGenerator;
  static std::mutex sMutex;
  std::lock_guard<std::mutex> lock(sMutex);
  return boost::uuids::to_string(sGenerator());
}

} // namespace

namespace eta {

AttributeSchema::AttributeSchema(AttributeType type, const string& name, const string& uuid)
    : type_{type}, name_{name}, uuid_{uuid.empty() ? makeUuid() : uuid} {}

AttributeSchema AttributeSchema::makeCategorical(
    const string& name,
    const set<string>& categories) {
  AttributeSchema schema(AttributeType::Categorical, name);
  schema.categories_ = categories;
  return schema;
}

AttributeSchema AttributeSchema::makeNumeric(const string& name) {
  return AttributeSchema(AttributeType::Numeric, name);
}

AttributeSchema AttributeSchema::makeNumeric(const string& name, double min, double max) {
  AttributeSchema schema(AttributeType::Numeric, name);
  schema.hasRange_ = true;
  schema.min_ = std::min(min, max);
  schema.max_ = std::max(min, max);
  return schema;
}

AttributeSchema AttributeSchema::makeBoolean(const string& name) {
  return AttributeSchema(AttributeType::Boolean, name);
}

bool AttributeSchema::getRange(double& outMin, double& outMax) const {
  if (!hasRange_) {
    return false;
  }
  outMin = min_;
  outMax = max_;
  return true;
}

bool AttributeSchema::isValidValue(const AttributeValue& value) const {
  if (value.type != type_) {
    return false;
  }
  switch (type_) {
    case AttributeType::Categorical:
      return categories_.find(value.categorical) != categories_.end();
    case AttributeType::Numeric:
      return hasRange_ && value.numeric >= min_ && value.numeric <= max_;
    case AttributeType::Boolean:
      return true;
    case AttributeType::Undefined:
    case AttributeType::COUNT:
      break;
  }
  return false;
}

bool AttributeSchema::isValidAttribute(const Attribute& attribute) const {
  return isValidValue(attribute.getValue());
}

int AttributeSchema::validateType(const Attribute& attribute) const {
  if (attribute.getType() != type_) {
    ETA_LOGW(
        "Expected attribute '{}' to be {}, found {}",
        attribute.getName(),
        toString(type_),
        toString(attribute.getType()));
    return TYPE_MISMATCH;
  }
  return SUCCESS;
}

int AttributeSchema::addAttribute(const Attribute& attribute) {
  IF_ERROR_RETURN(validateType(attribute));
  const AttributeValue& value = attribute.getValue();
  switch (type_) {
    case AttributeType::Categorical:
      categories_.insert(value.categorical);
      break;
    case AttributeType::Numeric:
      if (!value.isFinite()) {
        ETA_LOGW("Numeric attribute '{}' isn't finite: {}", attribute.getName(), value.numeric);
        return INVALID_PARAMETER;
      }
      if (hasRange_) {
        min_ = std::min(min_, value.numeric);
        max_ = std::max(max_, value.numeric);
      } else {
        hasRange_ = true;
        min_ = max_ = value.numeric;
      }
      break;
    case AttributeType::Boolean:
      break;
    case AttributeType::Undefined:
    case AttributeType::COUNT:
      return TYPE_MISMATCH;
  }
  return SUCCESS;
}

int AttributeSchema::mergeSchema(const AttributeSchema& other) {
  if (other.type_ != type_) {
    ETA_LOGW(
        "Can't merge {} schema '{}' into {} schema '{}'",
        toString(other.type_),
        other.name_,
        toString(type_),
        name_);
    return TYPE_MISMATCH;
  }
  switch (type_) {
    case AttributeType::Categorical:
      categories_.insert(other.categories_.begin(), other.categories_.end());
      break;
    case AttributeType::Numeric:
      if (!other.hasRange_) {
        break;
      }
      if (hasRange_) {
        min_ = std::min(min_, other.min_);
        max_ = std::max(max_, other.max_);
      } else {
        hasRange_ = true;
        min_ = other.min_;
        max_ = other.max_;
      }
      break;
    case AttributeType::Boolean:
      break;
    case AttributeType::Undefined:
    case AttributeType::COUNT:
      return TYPE_MISMATCH;
  }
  return SUCCESS;
}

bool AttributeSchema::operator==(const AttributeSchema& rhs) const {
  return type_ == rhs.type_ && name_ == rhs.name_ && uuid_ == rhs.uuid_ &&
      categories_ == rhs.categories_ && hasRange_ == rhs.hasRange_ &&
      (!hasRange_ || (min_ == rhs.min_ && max_ == rhs.max_));
}

void AttributeSchema::serialize(JsonWrapper& rj) const {
  rj.addMember("type", getAttributeDiscriminator(type_));
  rj.addMember("name", name_);
  rj.addMember("uuid", uuid_);
  switch (type_) {
    case AttributeType::Categorical: {
      vector<string> categories(categories_.begin(), categories_.end()); // sorted
      serializeVector(categories, rj, "categories");
      break;
    }
    case AttributeType::Numeric:
      if (hasRange_) {
        vector<double> range{min_, max_};
        serializeVector(range, rj, "range");
      }
      break;
    case AttributeType::Boolean:
    case AttributeType::Undefined:
    case AttributeType::COUNT:
      break;
  }
}

string AttributeSchema::toJson(JsonFormat format) const {
  JDocument doc;
  JsonWrapper rj{doc};
  serialize(rj);
  return jDocumentToJsonString(doc, format);
}

int AttributeSchema::fromJValue(const JValue& jschema, AttributeSchema& outSchema) {
  string discriminator;
  if (!getJString(discriminator, jschema, "type")) {
    ETA_LOGW("Attribute schema has no type discriminator");
    return INVALID_JSON;
  }
  AttributeType type = AttributeType::Undefined;
  if (AttributeTypeRegistry::get().getType(discriminator, type) != SUCCESS) {
    ETA_LOGW("Unknown attribute schema type '{}'", discriminator);
    return UNKNOWN_VARIANT;
  }
  string name;
  if (!getJString(name, jschema, "name")) {
    ETA_LOGW("Attribute schema of type '{}' has no name", discriminator);
    return INVALID_JSON;
  }
  string uuid;
  getJString(uuid, jschema, "uuid");
  AttributeSchema schema(type, name, uuid);
  switch (type) {
    case AttributeType::Categorical: {
      vector<string> categories;
      if (findJMember(jschema, "categories") != nullptr &&
          !getJStringVector(categories, jschema, "categories")) {
        ETA_LOGW("Invalid categories in schema '{}'", name);
        return INVALID_JSON;
      }
      schema.categories_.insert(categories.begin(), categories.end());
      break;
    }
    case AttributeType::Numeric: {
      const JValue* jrange = findJMember(jschema, "range");
      if (jrange == nullptr || jrange->IsNull()) {
        break;
      }
      if (!jrange->IsArray() || jrange->Size() != 2 || !(*jrange)[0].IsNumber() ||
          !(*jrange)[1].IsNumber()) {
        ETA_LOGW("Invalid range in schema '{}'", name);
        return INVALID_JSON;
      }
      double min = (*jrange)[0].GetDouble();
      double max = (*jrange)[1].GetDouble();
      if (!std::isfinite(min) || !std::isfinite(max)) {
        ETA_LOGW("Range of schema '{}' isn't finite", name);
        return INVALID_JSON;
      }
      schema.hasRange_ = true;
      schema.min_ = std::min(min, max);
      schema.max_ = std::max(min, max);
      break;
    }
    case AttributeType::Boolean:
    case AttributeType::Undefined:
    case AttributeType::COUNT:
      break;
  }
  outSchema = schema;
  return SUCCESS;
}

int AttributeSchema::fromJson(const string& json, AttributeSchema& outSchema) {
  JDocument doc;
  if (!jParse(doc, json) || !doc.IsObject()) {
    ETA_LOGW("Invalid attribute schema json: {}", helpers::make_printable(json));
    return INVALID_JSON;
  }
  return fromJValue(doc, outSchema);
}

} // namespace eta

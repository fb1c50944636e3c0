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

#include <eta/AttributeContainer.h>

#define DEFAULT_LOG_CHANNEL "AttributeContainer"
#include <logging/Log.h>

#include <eta/ErrorCode.h>
#include <eta/helpers/FileMacros.h>
#include <eta/helpers/Strings.h>
#include <eta/os/Utils.h>

using namespace std;

namespace {

int checkFinite(const eta::Attribute& attribute) {
  if (!attribute.getValue().isFinite()) {
    ETA_LOGW("Numeric attribute '{}' isn't finite", attribute.getName());
    return eta::INVALID_PARAMETER;
  }
  return eta::SUCCESS;
}

} // namespace

namespace eta {

int AttributeContainer::add(const Attribute& attribute) {
  IF_ERROR_RETURN(checkFinite(attribute));
  if (schema_) {
    IF_ERROR_RETURN(schema_->validateAttribute(attribute));
  }
  attributes_.push_back(attribute);
  return SUCCESS;
}

int AttributeContainer::addContainer(const AttributeContainer& other) {
  for (const Attribute& attribute : other.attributes_) {
    IF_ERROR_RETURN(checkFinite(attribute));
    if (schema_) {
      IF_ERROR_RETURN(schema_->validateAttribute(attribute));
    }
  }
  // other might be this container
  vector<Attribute> added(other.attributes_);
  attributes_.insert(attributes_.end(), added.begin(), added.end());
  return SUCCESS;
}

int AttributeContainer::setSchema(shared_ptr<const AttributeContainerSchema> schema) {
  if (schema) {
    for (const Attribute& attribute : attributes_) {
      IF_ERROR_RETURN(schema->validateAttribute(attribute));
    }
  }
  schema_ = std::move(schema);
  return SUCCESS;
}

int AttributeContainer::getActiveSchema(AttributeContainerSchema& outSchema) const {
  return AttributeContainerSchema::buildActiveSchema(attributes_, outSchema);
}

int AttributeContainer::freezeSchema() {
  auto schema = make_shared<AttributeContainerSchema>();
  IF_ERROR_RETURN(getActiveSchema(*schema));
  schema_ = std::move(schema);
  return SUCCESS;
}

void AttributeContainer::serialize(JsonWrapper& rj) const {
  using namespace eta_rapidjson;
  JValue jattributes(kArrayType);
  jattributes.Reserve(static_cast<SizeType>(attributes_.size()), rj.alloc);
  for (const Attribute& attribute : attributes_) {
    JValue jattribute(kObjectType);
    JsonWrapper wrapper{jattribute, rj.alloc};
    attribute.serialize(wrapper);
    jattributes.PushBack(jattribute, rj.alloc);
  }
  rj.addMember("attrs", jattributes);
  if (schema_) {
    JValue jschema(kObjectType);
    JsonWrapper wrapper{jschema, rj.alloc};
    schema_->serialize(wrapper);
    rj.addMember("schema", jschema);
  }
}

string AttributeContainer::toJson(JsonFormat format) const {
  JDocument doc;
  JsonWrapper rj{doc};
  serialize(rj);
  return jDocumentToJsonString(doc, format);
}

int AttributeContainer::fromJValue(const JValue& jcontainer, AttributeContainer& outContainer) {
  const JValue* jattributes = findJMember(jcontainer, "attrs");
  if (jattributes == nullptr || !jattributes->IsArray()) {
    ETA_LOGW("Attribute container has no 'attrs' array");
    return INVALID_JSON;
  }
  AttributeContainer container;
  const JValue* jschema = findJMember(jcontainer, "schema");
  if (jschema != nullptr && !jschema->IsNull()) {
    auto schema = make_shared<AttributeContainerSchema>();
    IF_ERROR_RETURN(AttributeContainerSchema::fromJValue(*jschema, *schema));
    container.schema_ = std::move(schema);
  }
  container.attributes_.reserve(jattributes->Size());
  for (auto iter = jattributes->Begin(); iter != jattributes->End(); ++iter) {
    Attribute attribute;
    IF_ERROR_RETURN(Attribute::fromJValue(*iter, attribute));
    IF_ERROR_RETURN(container.add(attribute));
  }
  outContainer = std::move(container);
  return SUCCESS;
}

int AttributeContainer::fromJson(const string& json, AttributeContainer& outContainer) {
  JDocument doc;
  if (!jParse(doc, json) || !doc.IsObject()) {
    ETA_LOGW("Invalid attribute container json: {}", helpers::make_printable(json));
    return INVALID_JSON;
  }
  return fromJValue(doc, outContainer);
}

int AttributeContainer::readJsonFile(const string& path, AttributeContainer& outContainer) {
  string json;
  IF_ERROR_LOG_AND_RETURN(os::readTextFile(path, json));
  return fromJson(json, outContainer);
}

int AttributeContainer::writeJsonFile(const string& path, JsonFormat format) const {
  return os::writeTextFile(path, toJson(format));
}

} // namespace eta

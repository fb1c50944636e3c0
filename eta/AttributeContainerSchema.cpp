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

#include <eta/AttributeContainerSchema.h>

#define DEFAULT_LOG_CHANNEL "AttributeContainerSchema"
#include <logging/Log.h>

#include <eta/ErrorCode.h>
#include <eta/helpers/FileMacros.h>
#include <eta/helpers/Strings.h>

using namespace std;

namespace eta {

bool AttributeContainerSchema::hasAttribute(const string& name) const {
  return schemas_.find(name) != schemas_.end();
}

const AttributeSchema* AttributeContainerSchema::getAttributeSchema(const string& name) const {
  auto iter = schemas_.find(name);
  return iter != schemas_.end() ? &iter->second : nullptr;
}

int AttributeContainerSchema::getAttributeType(const string& name, AttributeType& outType) const {
  const AttributeSchema* schema = getAttributeSchema(name);
  if (schema == nullptr) {
    return NAME_NOT_FOUND;
  }
  outType = schema->getType();
  return SUCCESS;
}

void AttributeContainerSchema::setAttributeSchema(const AttributeSchema& schema) {
  schemas_[schema.getName()] = schema;
}

int AttributeContainerSchema::addAttribute(const Attribute& attribute) {
  auto iter = schemas_.find(attribute.getName());
  if (iter != schemas_.end()) {
    return iter->second.addAttribute(attribute);
  }
  AttributeSchema schema(attribute.getType(), attribute.getName());
  IF_ERROR_RETURN(schema.addAttribute(attribute));
  schemas_.emplace(attribute.getName(), schema);
  return SUCCESS;
}

int AttributeContainerSchema::addAttributes(const vector<Attribute>& attributes) {
  AttributeContainerSchema updated(*this);
  for (const Attribute& attribute : attributes) {
    IF_ERROR_RETURN(updated.addAttribute(attribute));
  }
  schemas_.swap(updated.schemas_);
  return SUCCESS;
}

int AttributeContainerSchema::mergeSchema(const AttributeContainerSchema& other) {
  map<string, AttributeSchema> merged(schemas_);
  for (const auto& entry : other.schemas_) {
    auto iter = merged.find(entry.first);
    if (iter == merged.end()) {
      merged.emplace(entry.first, entry.second);
    } else {
      IF_ERROR_RETURN(iter->second.mergeSchema(entry.second));
    }
  }
  schemas_.swap(merged);
  return SUCCESS;
}

bool AttributeContainerSchema::isValidAttribute(const Attribute& attribute) const {
  const AttributeSchema* schema = getAttributeSchema(attribute.getName());
  return schema != nullptr && schema->isValidAttribute(attribute);
}

int AttributeContainerSchema::validateAttribute(const Attribute& attribute) const {
  const AttributeSchema* schema = getAttributeSchema(attribute.getName());
  if (schema == nullptr) {
    ETA_LOGW("Attribute '{}' is not allowed by the schema", attribute.getName());
    return NAME_NOT_FOUND;
  }
  IF_ERROR_RETURN(schema->validateType(attribute));
  if (!schema->isValidValue(attribute.getValue())) {
    ETA_LOGW(
        "Value '{}' of attribute '{}' is not allowed by the schema",
        attribute.getValue().asString(),
        attribute.getName());
    return VALUE_NOT_ALLOWED;
  }
  return SUCCESS;
}

int AttributeContainerSchema::buildActiveSchema(
    const vector<Attribute>& attributes,
    AttributeContainerSchema& out) {
  AttributeContainerSchema schema;
  IF_ERROR_RETURN(schema.addAttributes(attributes));
  out = schema;
  return SUCCESS;
}

void AttributeContainerSchema::serialize(JsonWrapper& rj) const {
  using namespace eta_rapidjson;
  JValue jschemas(kObjectType);
  for (const auto& entry : schemas_) {
    JValue jschema(kObjectType);
    JsonWrapper wrapper{jschema, rj.alloc};
    entry.second.serialize(wrapper);
    jschemas.AddMember(rj.jValue(entry.first), jschema, rj.alloc);
  }
  rj.addMember("schema", jschemas);
}

string AttributeContainerSchema::toJson(JsonFormat format) const {
  JDocument doc;
  JsonWrapper rj{doc};
  serialize(rj);
  return jDocumentToJsonString(doc, format);
}

int AttributeContainerSchema::fromJValue(
    const JValue& jschema,
    AttributeContainerSchema& outSchema) {
  const JValue* jschemas = findJMember(jschema, "schema");
  if (jschemas == nullptr || !jschemas->IsObject()) {
    ETA_LOGW("Attribute container schema has no 'schema' object");
    return INVALID_JSON;
  }
  AttributeContainerSchema schema;
  for (auto iter = jschemas->MemberBegin(); iter != jschemas->MemberEnd(); ++iter) {
    AttributeSchema attributeSchema;
    IF_ERROR_RETURN(AttributeSchema::fromJValue(iter->value, attributeSchema));
    string name(iter->name.GetString(), iter->name.GetStringLength());
    if (name != attributeSchema.getName()) {
      ETA_LOGW("Schema '{}' is stored under the name '{}'", attributeSchema.getName(), name);
      return INVALID_JSON;
    }
    schema.schemas_[name] = attributeSchema;
  }
  outSchema = schema;
  return SUCCESS;
}

int AttributeContainerSchema::fromJson(const string& json, AttributeContainerSchema& outSchema) {
  JDocument doc;
  if (!jParse(doc, json) || !doc.IsObject()) {
    ETA_LOGW("Invalid attribute container schema json: {}", helpers::make_printable(json));
    return INVALID_JSON;
  }
  return fromJValue(doc, outSchema);
}

} // namespace eta

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

#include <eta/DataRecord.h>

#include <algorithm>

#define DEFAULT_LOG_CHANNEL "DataRecord"
#include <logging/Log.h>

#include <eta/ErrorCode.h>

using namespace std;

namespace {

bool contains(const vector<string>& names, const string& name) {
  return find(names.begin(), names.end(), name) != names.end();
}

shared_ptr<eta::DataRecord> makeLabeledVideoRecord(
    const shared_ptr<const eta::DataRecordKind>& kind) {
  return make_shared<eta::LabeledVideoRecord>(kind);
}

} // namespace

namespace eta {

bool DataRecordKind::isRequired(const string& field) const {
  return contains(required_, field);
}

bool DataRecordKind::isOptional(const string& field) const {
  return contains(optional_, field);
}

bool DataRecordKind::isExcluded(const string& field) const {
  return contains(excluded_, field);
}

shared_ptr<DataRecord> DataRecordKind::makeRecord(const shared_ptr<const DataRecordKind>& kind) {
  if (kind->maker_ != nullptr) {
    return kind->maker_(kind);
  }
  return make_shared<DataRecord>(kind);
}

int DataRecord::getField(const string& name, FieldValue& outValue) const {
  const FieldValue* value = findField(name);
  if (value == nullptr) {
    return FIELD_NOT_FOUND;
  }
  outValue = *value;
  return SUCCESS;
}

const FieldValue* DataRecord::findField(const string& name) const {
  auto iter = fields_.find(name);
  return iter != fields_.end() ? &iter->second : nullptr;
}

int DataRecord::setField(const string& name, const FieldValue& value) {
  if (name.empty()) {
    return INVALID_PARAMETER;
  }
  fields_[name] = value;
  return SUCCESS;
}

int DataRecord::clearField(const string& name) {
  auto iter = fields_.find(name);
  if (iter == fields_.end()) {
    return FIELD_NOT_FOUND;
  }
  if (kind_->isRequired(name)) {
    ETA_LOGW("Can't clear field '{}', required by {} records", name, kind_->getName());
    return INVALID_REQUEST;
  }
  fields_.erase(iter);
  return SUCCESS;
}

int DataRecord::checkRequiredFields() const {
  for (const string& name : kind_->getRequired()) {
    if (!hasField(name)) {
      ETA_LOGW("Required field '{}' missing in {} record", name, kind_->getName());
      return MISSING_FIELD;
    }
  }
  return SUCCESS;
}

void DataRecord::serialize(JsonWrapper& rj) const {
  for (const auto& field : fields_) {
    if (!kind_->isExcluded(field.first)) {
      JValue value = field.second.toJValue(rj.alloc);
      rj.value.AddMember(rj.jValue(field.first), value, rj.alloc);
    }
  }
}

string DataRecord::toJson(JsonFormat format) const {
  JDocument doc;
  JsonWrapper rj{doc};
  serialize(rj);
  return jDocumentToJsonString(doc, format);
}

int DataRecord::fromJValue(
    const shared_ptr<const DataRecordKind>& kind,
    const JValue& jrecord,
    shared_ptr<DataRecord>& outRecord) {
  if (!jrecord.IsObject()) {
    ETA_LOGW("{} record isn't a json object", kind->getName());
    return INVALID_JSON;
  }
  shared_ptr<DataRecord> record = DataRecordKind::makeRecord(kind);
  for (const string& name : kind->getRequired()) {
    const JValue* jvalue = findJMember(jrecord, name);
    if (jvalue == nullptr) {
      ETA_LOGW("Required field '{}' missing in {} record", name, kind->getName());
      return MISSING_FIELD;
    }
    record->fields_[name] = FieldValue::fromJValue(*jvalue);
  }
  for (const string& name : kind->getOptional()) {
    const JValue* jvalue = findJMember(jrecord, name);
    if (jvalue != nullptr) {
      record->fields_[name] = FieldValue::fromJValue(*jvalue);
    }
  }
  outRecord = std::move(record);
  return SUCCESS;
}

string DataRecord::getStringField(const string& name) const {
  const FieldValue* value = findField(name);
  if (value == nullptr) {
    return {};
  }
  return value->getType() == FieldType::String ? value->getString() : value->asString();
}

const shared_ptr<const DataRecordKind>& LabeledVideoRecord::getRecordKind() {
  static const shared_ptr<const DataRecordKind> sKind = make_shared<const DataRecordKind>(
      kKindName,
      vector<string>{kVideoPath, kLabel},
      vector<string>{kGroup},
      vector<string>{},
      makeLabeledVideoRecord);
  return sKind;
}

shared_ptr<LabeledVideoRecord> LabeledVideoRecord::make(
    const string& videoPath,
    const string& label) {
  auto record = make_shared<LabeledVideoRecord>(getRecordKind());
  record->fields_[kVideoPath] = videoPath;
  record->fields_[kLabel] = label;
  return record;
}

shared_ptr<LabeledVideoRecord>
LabeledVideoRecord::make(const string& videoPath, const string& label, const string& group) {
  auto record = make(videoPath, label);
  record->fields_[kGroup] = group;
  return record;
}

DataRecordKindRegistry& DataRecordKindRegistry::get() {
  static DataRecordKindRegistry sInstance;
  return sInstance;
}

DataRecordKindRegistry::DataRecordKindRegistry() {
  const shared_ptr<const DataRecordKind>& kind = LabeledVideoRecord::getRecordKind();
  kinds_[kind->getName()] = kind;
}

int DataRecordKindRegistry::registerKind(const shared_ptr<const DataRecordKind>& kind) {
  if (!kind || kind->getName().empty()) {
    return INVALID_PARAMETER;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  kinds_[kind->getName()] = kind;
  return SUCCESS;
}

int DataRecordKindRegistry::getKind(const string& name, shared_ptr<const DataRecordKind>& outKind) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto iter = kinds_.find(name);
  if (iter == kinds_.end()) {
    return MISSING_RECORD_KIND;
  }
  outKind = iter->second;
  return SUCCESS;
}

} // namespace eta

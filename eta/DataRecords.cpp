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

#include <eta/DataRecords.h>

#define DEFAULT_LOG_CHANNEL "DataRecords"
#include <logging/Log.h>

#include <eta/ErrorCode.h>
#include <eta/helpers/FileMacros.h>
#include <eta/helpers/Strings.h>
#include <eta/os/Utils.h>

using namespace std;

namespace {

const char* kRecordsMember = "records";
const char* kRecordKindMember = "_RECORD_CLS";

bool isSameKind(const eta::DataRecordKind& left, const eta::DataRecordKind& right) {
  return &left == &right || left.getName() == right.getName();
}

} // namespace

namespace eta {

int DataRecords::add(const shared_ptr<DataRecord>& record) {
  if (!record) {
    return INVALID_PARAMETER;
  }
  if (!isSameKind(record->getKind(), *kind_)) {
    ETA_LOGW(
        "Can't add a {} record to a collection of {} records",
        record->getKind().getName(),
        kind_->getName());
    return RECORD_KIND_MISMATCH;
  }
  IF_ERROR_RETURN(record->checkRequiredFields());
  records_.push_back(record);
  return SUCCESS;
}

int DataRecords::addContainer(const DataRecords& other) {
  if (!isSameKind(other.getKind(), *kind_)) {
    ETA_LOGW(
        "Can't add {} records to a collection of {} records",
        other.getKind().getName(),
        kind_->getName());
    return RECORD_KIND_MISMATCH;
  }
  // other might be this collection
  vector<shared_ptr<DataRecord>> added(other.records_);
  records_.insert(records_.end(), added.begin(), added.end());
  return SUCCESS;
}

const FieldValue* DataRecords::getRecordField(size_t index, const string& field) const {
  const FieldValue* value = records_[index]->findField(field);
  if (value == nullptr) {
    ETA_LOGW("Record #{} has no field '{}'", index, field);
  }
  return value;
}

int DataRecords::buildKeyset(const string& field, set<FieldValue>& outKeys) const {
  set<FieldValue> keys;
  for (size_t index = 0; index < records_.size(); ++index) {
    const FieldValue* value = getRecordField(index, field);
    if (value == nullptr) {
      return FIELD_NOT_FOUND;
    }
    keys.insert(*value);
  }
  outKeys.swap(keys);
  return SUCCESS;
}

int DataRecords::buildLookup(const string& field, map<FieldValue, vector<size_t>>& outLookup)
    const {
  map<FieldValue, vector<size_t>> lookup;
  for (size_t index = 0; index < records_.size(); ++index) {
    const FieldValue* value = getRecordField(index, field);
    if (value == nullptr) {
      return FIELD_NOT_FOUND;
    }
    lookup[*value].push_back(index);
  }
  outLookup.swap(lookup);
  return SUCCESS;
}

int DataRecords::buildSubsets(
    const string& field,
    map<FieldValue, vector<shared_ptr<DataRecord>>>& outSubsets) const {
  map<FieldValue, vector<shared_ptr<DataRecord>>> subsets;
  for (size_t index = 0; index < records_.size(); ++index) {
    const FieldValue* value = getRecordField(index, field);
    if (value == nullptr) {
      return FIELD_NOT_FOUND;
    }
    subsets[*value].push_back(records_[index]);
  }
  outSubsets.swap(subsets);
  return SUCCESS;
}

int DataRecords::slice(const string& field, vector<FieldValue>& outValues) const {
  vector<FieldValue> values;
  values.reserve(records_.size());
  for (size_t index = 0; index < records_.size(); ++index) {
    const FieldValue* value = getRecordField(index, field);
    if (value == nullptr) {
      return FIELD_NOT_FOUND;
    }
    values.push_back(*value);
  }
  outValues.swap(values);
  return SUCCESS;
}

int DataRecords::cull(
    const string& field,
    const vector<FieldValue>* keepValues,
    const vector<FieldValue>* removeValues,
    size_t& outCount) {
  if ((keepValues == nullptr) == (removeValues == nullptr)) {
    ETA_LOGW("Exactly one of the values to keep or to remove must be provided");
    return ARGUMENT_ERROR;
  }
  vector<FieldValue> values;
  IF_ERROR_RETURN(slice(field, values));
  set<FieldValue> keep;
  if (keepValues != nullptr) {
    keep.insert(keepValues->begin(), keepValues->end());
  } else {
    keep.insert(values.begin(), values.end());
    for (const FieldValue& value : *removeValues) {
      keep.erase(value);
    }
  }
  if (keep.empty()) {
    ETA_LOGW("No value of field '{}' to keep", field);
    return ARGUMENT_ERROR;
  }
  vector<shared_ptr<DataRecord>> kept;
  kept.reserve(records_.size());
  for (size_t index = 0; index < records_.size(); ++index) {
    if (keep.find(values[index]) != keep.end()) {
      kept.push_back(records_[index]);
    }
  }
  records_.swap(kept);
  outCount = records_.size();
  return SUCCESS;
}

int DataRecords::subsetFromIndices(
    const vector<size_t>& indices,
    unique_ptr<DataRecords>& outSubset) const {
  auto subset = make_unique<DataRecords>(kind_);
  subset->records_.reserve(indices.size());
  for (size_t index : indices) {
    if (index >= records_.size()) {
      ETA_LOGW("Record index {} out of bounds, {} records", index, records_.size());
      return INDEX_OUT_OF_BOUNDS;
    }
    subset->records_.push_back(records_[index]);
  }
  outSubset = std::move(subset);
  return SUCCESS;
}

int DataRecords::addJson(const string& json, const shared_ptr<const DataRecordKind>& kind) {
  unique_ptr<DataRecords> records;
  IF_ERROR_RETURN(fromJson(json, kind ? kind : kind_, records));
  return addContainer(*records);
}

int DataRecords::addJsonFile(const string& path, const shared_ptr<const DataRecordKind>& kind) {
  unique_ptr<DataRecords> records;
  IF_ERROR_RETURN(readJsonFile(path, kind ? kind : kind_, records));
  return addContainer(*records);
}

void DataRecords::serialize(JsonWrapper& rj, bool embedKind) const {
  using namespace eta_rapidjson;
  JValue jrecords(kArrayType);
  jrecords.Reserve(static_cast<SizeType>(records_.size()), rj.alloc);
  for (const auto& record : records_) {
    JValue jrecord(kObjectType);
    JsonWrapper wrapper{jrecord, rj.alloc};
    record->serialize(wrapper);
    jrecords.PushBack(jrecord, rj.alloc);
  }
  rj.addMember(kRecordsMember, jrecords);
  if (embedKind) {
    rj.addMember(kRecordKindMember, kind_->getName());
  }
}

string DataRecords::toJson(JsonFormat format, bool embedKind) const {
  JDocument doc;
  JsonWrapper rj{doc};
  serialize(rj, embedKind);
  return jDocumentToJsonString(doc, format);
}

int DataRecords::writeJsonFile(const string& path, JsonFormat format, bool embedKind) const {
  return os::writeTextFile(path, toJson(format, embedKind));
}

int DataRecords::fromJValue(
    const JValue& jrecords,
    const shared_ptr<const DataRecordKind>& kind,
    unique_ptr<DataRecords>& outRecords) {
  if (!jrecords.IsObject()) {
    return INVALID_JSON;
  }
  shared_ptr<const DataRecordKind> recordKind = kind;
  if (!recordKind) {
    string kindName;
    if (!getJString(kindName, jrecords, kRecordKindMember)) {
      ETA_LOGW("Need a record kind to parse the records");
      return MISSING_RECORD_KIND;
    }
    if (DataRecordKindRegistry::get().getKind(kindName, recordKind) != SUCCESS) {
      ETA_LOGW("Record kind '{}' isn't registered", kindName);
      return MISSING_RECORD_KIND;
    }
  }
  const JValue* jarray = findJMember(jrecords, kRecordsMember);
  if (jarray == nullptr || !jarray->IsArray()) {
    ETA_LOGW("No '{}' array in {} records", kRecordsMember, recordKind->getName());
    return INVALID_JSON;
  }
  auto records = make_unique<DataRecords>(recordKind);
  records->records_.reserve(jarray->Size());
  for (auto iter = jarray->Begin(); iter != jarray->End(); ++iter) {
    shared_ptr<DataRecord> record;
    IF_ERROR_RETURN(DataRecord::fromJValue(recordKind, *iter, record));
    records->records_.push_back(std::move(record));
  }
  outRecords = std::move(records);
  return SUCCESS;
}

int DataRecords::fromJson(
    const string& json,
    const shared_ptr<const DataRecordKind>& kind,
    unique_ptr<DataRecords>& outRecords) {
  JDocument doc;
  if (!jParse(doc, json)) {
    ETA_LOGW("Invalid records json: {}", jParseErrorMessage(doc));
    return INVALID_JSON;
  }
  return fromJValue(doc, kind, outRecords);
}

int DataRecords::readJsonFile(
    const string& path,
    const shared_ptr<const DataRecordKind>& kind,
    unique_ptr<DataRecords>& outRecords) {
  string json;
  IF_ERROR_LOG_AND_RETURN(os::readTextFile(path, json));
  return fromJson(json, kind, outRecords);
}

} // namespace eta

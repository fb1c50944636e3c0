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

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include <eta/DataRecord.h>

namespace eta {

using std::map;
using std::set;
using std::shared_ptr;
using std::string;
using std::unique_ptr;
using std::vector;

/// Default file name of DataRecords json documents.
constexpr const char* kDefaultDataRecordsFilename = "records.json";

/// \brief An ordered collection of records, all of the same kind.
///
/// The record kind is set at construction, and can't change.
/// Records can be indexed, filtered and sliced by the value of any of their fields.
/// Any operation that needs a field fails with FIELD_NOT_FOUND if a record doesn't have it,
/// without modifying the collection.
class DataRecords {
 public:
  using const_iterator = vector<shared_ptr<DataRecord>>::const_iterator;

  explicit DataRecords(shared_ptr<const DataRecordKind> kind) : kind_{std::move(kind)} {}

  const DataRecordKind& getKind() const {
    return *kind_;
  }
  const shared_ptr<const DataRecordKind>& getKindPtr() const {
    return kind_;
  }

  size_t size() const {
    return records_.size();
  }
  bool empty() const {
    return records_.empty();
  }
  const shared_ptr<DataRecord>& operator[](size_t index) const {
    return records_[index];
  }
  const vector<shared_ptr<DataRecord>>& getRecords() const {
    return records_;
  }
  const_iterator begin() const {
    return records_.begin();
  }
  const_iterator end() const {
    return records_.end();
  }

  /// Add a record at the end of the collection.
  /// @return 0 on success, INVALID_PARAMETER for a null record, RECORD_KIND_MISMATCH if the
  /// record isn't of the collection's kind, MISSING_FIELD if a required field isn't set.
  int add(const shared_ptr<DataRecord>& record);

  /// Add all the records of another collection of the same kind.
  /// @return 0 on success, RECORD_KIND_MISMATCH if the kinds differ.
  int addContainer(const DataRecords& other);

  void clear() {
    records_.clear();
  }

  /// Get the distinct values of a field.
  int buildKeyset(const string& field, set<FieldValue>& outKeys) const;

  /// Map each value of a field to the positions of the records with that value,
  /// in increasing order.
  int buildLookup(const string& field, map<FieldValue, vector<size_t>>& outLookup) const;

  /// Map each value of a field to the records with that value, in collection order.
  /// The records are shared with the collection.
  int buildSubsets(
      const string& field,
      map<FieldValue, vector<shared_ptr<DataRecord>>>& outSubsets) const;

  /// Get the value of a field for each record, in collection order.
  int slice(const string& field, vector<FieldValue>& outValues) const;

  /// Only keep the records which field value is to be kept, in their original order.
  /// Exactly one of keepValues and removeValues must be provided.
  /// @param field: name of the field to test.
  /// @param keepValues: if provided, the values to keep.
  /// @param removeValues: if provided, the values to remove. All the other values are kept.
  /// @param outCount: on success, the number of records left.
  /// @return 0 on success, ARGUMENT_ERROR if both or none of keepValues and removeValues are
  /// provided, or if there is no value to keep. FIELD_NOT_FOUND if a record lacks the field.
  int cull(
      const string& field,
      const vector<FieldValue>* keepValues,
      const vector<FieldValue>* removeValues,
      size_t& outCount);

  /// Make a new collection of the same kind, with the records at the given positions,
  /// in the given order. Positions may be repeated.
  /// @return 0 on success, INDEX_OUT_OF_BOUNDS if a position is invalid.
  int subsetFromIndices(const vector<size_t>& indices, unique_ptr<DataRecords>& outSubset) const;

  /// Parse a json document and add its records, all or nothing.
  /// @param json: a DataRecords json document.
  /// @param kind: the kind of the records in the document, or nullptr to use this collection's
  /// kind.
  /// @return 0 on success, or a parsing error, or RECORD_KIND_MISMATCH if the kind provided
  /// isn't this collection's kind.
  int addJson(const string& json, const shared_ptr<const DataRecordKind>& kind = nullptr);
  int addJsonFile(const string& path, const shared_ptr<const DataRecordKind>& kind = nullptr);

  /// Json form: {"records": [...], "_RECORD_CLS": "<record kind name>"}
  void serialize(JsonWrapper& rj, bool embedKind = true) const;
  string toJson(JsonFormat format = JsonFormat::Compact, bool embedKind = true) const;
  int writeJsonFile(
      const string& path,
      JsonFormat format = JsonFormat::Pretty,
      bool embedKind = true) const;

  /// Build a collection from a json document.
  /// @param kind: the kind of the records. If nullptr, the kind named by the document's
  /// "_RECORD_CLS" member is looked up in the DataRecordKindRegistry.
  /// @return 0 on success, MISSING_RECORD_KIND if no record kind could be determined,
  /// INVALID_JSON if the document is malformed, MISSING_FIELD if a required field is missing.
  static int fromJValue(
      const JValue& jrecords,
      const shared_ptr<const DataRecordKind>& kind,
      unique_ptr<DataRecords>& outRecords);
  static int fromJson(
      const string& json,
      const shared_ptr<const DataRecordKind>& kind,
      unique_ptr<DataRecords>& outRecords);
  static int readJsonFile(
      const string& path,
      const shared_ptr<const DataRecordKind>& kind,
      unique_ptr<DataRecords>& outRecords);

 private:
  const FieldValue* getRecordField(size_t index, const string& field) const;

  shared_ptr<const DataRecordKind> kind_;
  vector<shared_ptr<DataRecord>> records_;
};

} // namespace eta

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
#include <mutex>
#include <string>
#include <vector>

#include <eta/FieldValue.h>

namespace eta {

using std::map;
using std::shared_ptr;
using std::string;
using std::vector;

class DataRecord;
class DataRecordKind;

using RecordMaker = shared_ptr<DataRecord> (*)(const shared_ptr<const DataRecordKind>& kind);

/// \brief Description of a kind of records: its name, and the fields its records use.
///
/// - Required fields must be present in serialized records.
/// - Optional fields are read only when present. Absent is different from null.
/// - Excluded fields may be set on records, but are never serialized.
class DataRecordKind {
 public:
  DataRecordKind(
      const string& name,
      const vector<string>& required,
      const vector<string>& optional = {},
      const vector<string>& excluded = {},
      RecordMaker maker = nullptr)
      : name_{name},
        required_{required},
        optional_{optional},
        excluded_{excluded},
        maker_{maker} {}

  const string& getName() const {
    return name_;
  }
  const vector<string>& getRequired() const {
    return required_;
  }
  const vector<string>& getOptional() const {
    return optional_;
  }
  const vector<string>& getExcluded() const {
    return excluded_;
  }

  bool isRequired(const string& field) const;
  bool isOptional(const string& field) const;
  bool isExcluded(const string& field) const;

  /// Make an empty record of a kind, using the kind's maker if it has one.
  static shared_ptr<DataRecord> makeRecord(const shared_ptr<const DataRecordKind>& kind);

 private:
  string name_;
  vector<string> required_;
  vector<string> optional_;
  vector<string> excluded_;
  RecordMaker maker_;
};

/// \brief A record: a set of named fields, each with a value, of a given kind.
///
/// Fields are set by name, and may be absent. Specialized records add typed accessors.
class DataRecord {
 public:
  explicit DataRecord(shared_ptr<const DataRecordKind> kind) : kind_{std::move(kind)} {}
  virtual ~DataRecord() = default;

  const DataRecordKind& getKind() const {
    return *kind_;
  }
  const shared_ptr<const DataRecordKind>& getKindPtr() const {
    return kind_;
  }

  bool hasField(const string& name) const {
    return fields_.find(name) != fields_.end();
  }
  const map<string, FieldValue>& getFields() const {
    return fields_;
  }

  /// Get the value of a field.
  /// @return 0 on success, FIELD_NOT_FOUND if the field isn't set.
  int getField(const string& name, FieldValue& outValue) const;
  /// Get a field's value, or nullptr if the field isn't set.
  const FieldValue* findField(const string& name) const;

  /// Set the value of a field. Any non-empty name may be used.
  /// @return 0 on success, INVALID_PARAMETER if the name is empty.
  int setField(const string& name, const FieldValue& value);

  /// Remove a field, so that it's absent (not null).
  /// @return 0 on success, FIELD_NOT_FOUND if the field isn't set, INVALID_REQUEST if the field
  /// is required by the record's kind.
  int clearField(const string& name);

  /// Check that all the fields required by the record's kind are set.
  /// @return 0 on success, MISSING_FIELD otherwise.
  int checkRequiredFields() const;

  /// Add the serializable fields to a json object: all set fields except the excluded ones.
  virtual void serialize(JsonWrapper& rj) const;
  string toJson(JsonFormat format = JsonFormat::Compact) const;

  /// Build a record from its json form: the required fields are copied, and so are the
  /// optional fields when present. Other members are ignored.
  /// @return 0 on success, MISSING_FIELD if a required field is missing, INVALID_JSON if the
  /// json value isn't an object.
  static int fromJValue(
      const shared_ptr<const DataRecordKind>& kind,
      const JValue& jrecord,
      shared_ptr<DataRecord>& outRecord);

 protected:
  string getStringField(const string& name) const;

  shared_ptr<const DataRecordKind> kind_;
  map<string, FieldValue> fields_;
};

/// A labeled video: "video_path" & "label" are required, "group" is optional.
/// "group" may name the video a clip was sampled from, for instance.
class LabeledVideoRecord : public DataRecord {
 public:
  static constexpr const char* kKindName = "eta.core.data.LabeledVideoRecord";
  static constexpr const char* kVideoPath = "video_path";
  static constexpr const char* kLabel = "label";
  static constexpr const char* kGroup = "group";

  explicit LabeledVideoRecord(shared_ptr<const DataRecordKind> kind)
      : DataRecord(std::move(kind)) {}

  static const shared_ptr<const DataRecordKind>& getRecordKind();

  static shared_ptr<LabeledVideoRecord> make(const string& videoPath, const string& label);
  static shared_ptr<LabeledVideoRecord>
  make(const string& videoPath, const string& label, const string& group);

  string getVideoPath() const {
    return getStringField(kVideoPath);
  }
  string getLabel() const {
    return getStringField(kLabel);
  }
  bool hasGroup() const {
    return hasField(kGroup);
  }
  string getGroup() const {
    return getStringField(kGroup);
  }
};

/// \brief Registry of the record kinds, so that records can be read from json documents
/// that name their kind.
///
/// LabeledVideoRecord's kind is registered at construction.
/// This class is thread-safe.
class DataRecordKindRegistry {
 public:
  static DataRecordKindRegistry& get();

  /// Register a record kind under its name, replacing any kind with the same name.
  /// @return 0 on success, INVALID_PARAMETER if the kind is null or has no name.
  int registerKind(const shared_ptr<const DataRecordKind>& kind);

  /// Find a record kind by name.
  /// @return 0 on success, MISSING_RECORD_KIND if no kind has that name.
  int getKind(const string& name, shared_ptr<const DataRecordKind>& outKind);

 protected:
  DataRecordKindRegistry();

 private:
  std::mutex mutex_;
  map<string, shared_ptr<const DataRecordKind>> kinds_;
};

} // namespace eta

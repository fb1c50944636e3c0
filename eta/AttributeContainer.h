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

#include <memory>
#include <string>
#include <vector>

#include <eta/AttributeContainerSchema.h>

namespace eta {

using std::shared_ptr;
using std::string;
using std::vector;

/// \brief An ordered collection of attributes, optionally constrained by a schema.
///
/// Insertion order is preserved, and the same attribute may be added multiple times.
/// When a schema is attached, every insertion is validated first, and rejected attributes are
/// not added. The schema may be shared between containers: it is never modified by the
/// container, only replaced or detached.
class AttributeContainer {
 public:
  using const_iterator = vector<Attribute>::const_iterator;

  AttributeContainer() = default;
  explicit AttributeContainer(shared_ptr<const AttributeContainerSchema> schema)
      : schema_{std::move(schema)} {}

  size_t size() const {
    return attributes_.size();
  }
  bool empty() const {
    return attributes_.empty();
  }
  const Attribute& operator[](size_t index) const {
    return attributes_[index];
  }
  const vector<Attribute>& getAttributes() const {
    return attributes_;
  }
  const_iterator begin() const {
    return attributes_.begin();
  }
  const_iterator end() const {
    return attributes_.end();
  }

  /// Add an attribute at the end of the container.
  /// @return 0 on success, or when a schema is attached and the attribute doesn't comply,
  /// NAME_NOT_FOUND, TYPE_MISMATCH or VALUE_NOT_ALLOWED. The container is then unchanged.
  int add(const Attribute& attribute);

  /// Add all the attributes of another container, all or nothing.
  /// @return 0 on success, or the first validation error, in which case nothing is added.
  int addContainer(const AttributeContainer& other);

  /// Remove all the attributes. The schema, if any, is kept.
  void clear() {
    attributes_.clear();
  }

  bool hasSchema() const {
    return schema_ != nullptr;
  }
  /// @return The attached schema, or nullptr.
  const shared_ptr<const AttributeContainerSchema>& getSchema() const {
    return schema_;
  }

  /// Attach a schema, after validating the current attributes against it.
  /// @return 0 on success, or the first validation error, in which case the container keeps
  /// its current schema.
  int setSchema(shared_ptr<const AttributeContainerSchema> schema);

  /// Build the smallest schema that accepts the current attributes.
  /// The attached schema, if any, is ignored.
  /// @return 0 on success, TYPE_MISMATCH if a name is used with different types.
  int getActiveSchema(AttributeContainerSchema& outSchema) const;

  /// Attach the active schema, so that only values seen so far are accepted from now on.
  /// @return 0 on success, TYPE_MISMATCH if a name is used with different types.
  int freezeSchema();

  /// Detach the schema, if any.
  void removeSchema() {
    schema_.reset();
  }

  /// Json form: {"attrs": [Attribute...], "schema"?: AttributeContainerSchema}
  void serialize(JsonWrapper& rj) const;
  string toJson(JsonFormat format = JsonFormat::Compact) const;

  /// Rebuild a container from its json form. A stored schema is attached, and the attributes
  /// validated against it.
  static int fromJValue(const JValue& jcontainer, AttributeContainer& outContainer);
  static int fromJson(const string& json, AttributeContainer& outContainer);

  /// Read & write json files.
  static int readJsonFile(const string& path, AttributeContainer& outContainer);
  int writeJsonFile(const string& path, JsonFormat format = JsonFormat::Pretty) const;

 private:
  vector<Attribute> attributes_;
  shared_ptr<const AttributeContainerSchema> schema_;
};

} // namespace eta

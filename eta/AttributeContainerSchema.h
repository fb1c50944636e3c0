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
#include <string>
#include <vector>

#include <eta/AttributeSchema.h>

namespace eta {

using std::map;
using std::string;
using std::vector;

/// \brief The schema of an AttributeContainer: one AttributeSchema per allowed attribute name.
///
/// The type of each entry is set by the first attribute or schema seen for that name.
/// Every mutating method either succeeds entirely, or leaves the schema unchanged.
class AttributeContainerSchema {
 public:
  AttributeContainerSchema() = default;

  bool empty() const {
    return schemas_.empty();
  }
  size_t size() const {
    return schemas_.size();
  }
  const map<string, AttributeSchema>& getSchemas() const {
    return schemas_;
  }

  /// Tell if an attribute name is allowed by the schema.
  bool hasAttribute(const string& name) const;

  /// Get the schema of an attribute name.
  /// @return A pointer to the schema, or nullptr if the name isn't in the schema.
  const AttributeSchema* getAttributeSchema(const string& name) const;

  /// Get the type of the attributes of a given name.
  /// @return 0 on success, NAME_NOT_FOUND if the name isn't in the schema.
  int getAttributeType(const string& name, AttributeType& outType) const;

  /// Add or replace the schema of an attribute name.
  void setAttributeSchema(const AttributeSchema& schema);

  /// Incorporate an attribute: the entry for its name is created on first sight,
  /// typed after the attribute, then grown to accept the attribute.
  /// @return 0 on success, TYPE_MISMATCH if an entry of another type exists for that name.
  int addAttribute(const Attribute& attribute);

  /// Incorporate a series of attributes, all or nothing.
  /// @return 0 on success, or the first error met, in which case the schema is unchanged.
  int addAttributes(const vector<Attribute>& attributes);

  /// Incorporate another container schema: new names are copied, existing ones merged.
  /// @return 0 on success, or TYPE_MISMATCH if an existing entry has another type, in which
  /// case the schema is unchanged.
  int mergeSchema(const AttributeContainerSchema& other);

  /// Tell if an attribute is allowed by the schema.
  bool isValidAttribute(const Attribute& attribute) const;

  /// Verify that an attribute is allowed by the schema.
  /// @return 0 if valid, NAME_NOT_FOUND if the name isn't in the schema, TYPE_MISMATCH if the
  /// attribute's type isn't the schema's type, VALUE_NOT_ALLOWED if the value isn't allowed.
  int validateAttribute(const Attribute& attribute) const;

  /// Build the smallest schema accepting every attribute of a list.
  /// @return 0 on success, TYPE_MISMATCH if the same name is used with different types.
  static int buildActiveSchema(const vector<Attribute>& attributes, AttributeContainerSchema& out);

  bool operator==(const AttributeContainerSchema& rhs) const {
    return schemas_ == rhs.schemas_;
  }

  /// Json form: {"schema": {"<name>": AttributeSchema, ...}}
  void serialize(JsonWrapper& rj) const;
  string toJson(JsonFormat format = JsonFormat::Compact) const;
  static int fromJValue(const JValue& jschema, AttributeContainerSchema& outSchema);
  static int fromJson(const string& json, AttributeContainerSchema& outSchema);

 private:
  map<string, AttributeSchema> schemas_;
};

} // namespace eta

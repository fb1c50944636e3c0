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

#include <set>
#include <string>

#include <eta/Attribute.h>

namespace eta {

using std::set;
using std::string;

/// \brief Constraints on the values of the attributes of a given name.
///
/// A schema has the type of the attributes it describes, and a payload specific to that type:
/// - Categorical schemas hold the set of allowed categories.
/// - Numeric schemas hold an optional inclusive [min, max] range. Without a range, no value is
///   valid.
/// - Boolean schemas have no payload: every boolean is valid.
///
/// Schemas grow by observing attributes (addAttribute) or other schemas (mergeSchema),
/// but never shrink.
class AttributeSchema {
 public:
  AttributeSchema() = default;
  /// Create an empty schema. An empty uuid is replaced by a newly generated one.
  AttributeSchema(AttributeType type, const string& name, const string& uuid = {});

  static AttributeSchema makeCategorical(const string& name, const set<string>& categories = {});
  static AttributeSchema makeNumeric(const string& name);
  static AttributeSchema makeNumeric(const string& name, double min, double max);
  static AttributeSchema makeBoolean(const string& name);

  AttributeType getType() const {
    return type_;
  }
  const string& getName() const {
    return name_;
  }
  const string& getUuid() const {
    return uuid_;
  }

  /// Categorical schemas only.
  const set<string>& getCategories() const {
    return categories_;
  }

  /// Numeric schemas only.
  bool hasRange() const {
    return hasRange_;
  }
  /// Get the range of a numeric schema.
  /// @return True if the schema has a range, in which case outMin & outMax are set.
  bool getRange(double& outMin, double& outMax) const;

  /// Tell if a value is allowed by this schema.
  /// The value's type must match the schema's type.
  bool isValidValue(const AttributeValue& value) const;

  /// Tell if an attribute is allowed by this schema: same type & allowed value.
  bool isValidAttribute(const Attribute& attribute) const;

  /// Check that an attribute is of the type this schema describes.
  /// @return 0 if it is, TYPE_MISMATCH otherwise.
  int validateType(const Attribute& attribute) const;

  /// Grow the schema so that the attribute becomes valid.
  /// Categorical: the value becomes an allowed category.
  /// Numeric: the range is expanded, or initialized, to include the value.
  /// @return 0 on success, TYPE_MISMATCH if the attribute's type doesn't match (schema unchanged).
  int addAttribute(const Attribute& attribute);

  /// Grow the schema so that everything valid for another schema is valid for this one.
  /// Categorical: set union. Numeric: range union, an unset range taking the other's range.
  /// @return 0 on success, TYPE_MISMATCH if the types differ (schema unchanged).
  int mergeSchema(const AttributeSchema& other);

  bool operator==(const AttributeSchema& rhs) const;
  bool operator!=(const AttributeSchema& rhs) const {
    return !operator==(rhs);
  }

  void serialize(JsonWrapper& rj) const;
  string toJson(JsonFormat format = JsonFormat::Compact) const;

  /// Rebuild a schema from its json form.
  /// @return 0 on success, UNKNOWN_VARIANT if the discriminator isn't registered, INVALID_JSON
  /// if the document is malformed.
  static int fromJValue(const JValue& jschema, AttributeSchema& outSchema);
  static int fromJson(const string& json, AttributeSchema& outSchema);

 private:
  AttributeType type_{AttributeType::Undefined};
  string name_;
  string uuid_;
  set<string> categories_;
  bool hasRange_{false};
  double min_{0};
  double max_{0};
};

} // namespace eta

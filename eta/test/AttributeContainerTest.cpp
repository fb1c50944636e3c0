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

#include <cmath>

#include <gtest/gtest.h>

#include <eta/AttributeContainer.h>
#include <eta/ErrorCode.h>
#include <eta/os/Utils.h>

using namespace std;
using namespace eta;

namespace {

struct AttributeContainerTest : testing::Test {
  AttributeContainerTest() {
    EXPECT_EQ(container.add(Attribute::makeCategorical("label", "cat")), SUCCESS);
    EXPECT_EQ(container.add(Attribute::makeNumeric("weight", 4)), SUCCESS);
    EXPECT_EQ(container.add(Attribute::makeCategorical("label", "dog", 0.5)), SUCCESS);
    EXPECT_EQ(container.add(Attribute::makeNumeric("weight", 7)), SUCCESS);
    EXPECT_EQ(container.add(Attribute::makeBoolean("occluded", false)), SUCCESS);
  }

  AttributeContainer container;
};

} // namespace

TEST_F(AttributeContainerTest, noSchemaTest) {
  EXPECT_FALSE(container.hasSchema());
  ASSERT_EQ(container.size(), 5);
  EXPECT_EQ(container[0], Attribute::makeCategorical("label", "cat"));
  EXPECT_EQ(container[2].getConfidence(), 0.5);
  // duplicates are fine
  EXPECT_EQ(container.add(Attribute::makeNumeric("weight", 4)), SUCCESS);
  EXPECT_EQ(container.size(), 6);
  size_t count = 0;
  for (const Attribute& attribute : container) {
    EXPECT_FALSE(attribute.getName().empty());
    count++;
  }
  EXPECT_EQ(count, container.size());
}

TEST_F(AttributeContainerTest, activeSchemaTest) {
  AttributeContainerSchema schema;
  EXPECT_EQ(container.getActiveSchema(schema), SUCCESS);
  EXPECT_EQ(schema.size(), 3);
  EXPECT_TRUE(schema.hasAttribute("label"));
  EXPECT_FALSE(schema.hasAttribute("color"));
  AttributeType type = AttributeType::Undefined;
  EXPECT_EQ(schema.getAttributeType("weight", type), SUCCESS);
  EXPECT_EQ(type, AttributeType::Numeric);
  EXPECT_EQ(schema.getAttributeType("color", type), NAME_NOT_FOUND);

  const AttributeSchema* weight = schema.getAttributeSchema("weight");
  ASSERT_NE(weight, nullptr);
  double min = 0, max = 0;
  EXPECT_TRUE(weight->getRange(min, max));
  EXPECT_EQ(min, 4);
  EXPECT_EQ(max, 7);

  // the active schema validates every attribute it was built from
  for (const Attribute& attribute : container) {
    EXPECT_EQ(schema.validateAttribute(attribute), SUCCESS);
  }
  // no schema was attached
  EXPECT_FALSE(container.hasSchema());
}

TEST_F(AttributeContainerTest, nonFiniteTest) {
  EXPECT_EQ(container.add(Attribute::makeNumeric("weight", std::nan(""))), INVALID_PARAMETER);
  EXPECT_EQ(container.add(Attribute::makeNumeric("weight", HUGE_VAL)), INVALID_PARAMETER);
  EXPECT_EQ(container.size(), 5);

  AttributeContainer other;
  EXPECT_EQ(other.add(Attribute::makeNumeric("weight", 5)), SUCCESS);
  EXPECT_EQ(other.add(Attribute::makeNumeric("weight", -std::nan(""))), INVALID_PARAMETER);
  EXPECT_EQ(other.add(Attribute::makeNumeric("weight", 9)), SUCCESS);
  EXPECT_EQ(container.addContainer(other), SUCCESS);
  EXPECT_EQ(container.size(), 7);

  // the frozen schema still accepts every attribute of the container
  EXPECT_EQ(container.freezeSchema(), SUCCESS);
  for (const Attribute& attribute : container) {
    EXPECT_EQ(container.getSchema()->validateAttribute(attribute), SUCCESS);
  }
  EXPECT_EQ(container.add(Attribute::makeNumeric("weight", 5)), SUCCESS);

  AttributeContainer loaded;
  EXPECT_EQ(
      AttributeContainer::fromJson(
          R"({"attrs": [{"type": "eta.core.data.NumericAttribute", "name": "x", "value": NaN}]})",
          loaded),
      VALUE_PARSE_ERROR);
}

TEST_F(AttributeContainerTest, freezeSchemaTest) {
  EXPECT_EQ(container.freezeSchema(), SUCCESS);
  EXPECT_TRUE(container.hasSchema());
  size_t size = container.size();

  EXPECT_EQ(container.add(Attribute::makeNumeric("weight", 10)), VALUE_NOT_ALLOWED);
  EXPECT_EQ(container.add(Attribute::makeCategorical("label", "bird")), VALUE_NOT_ALLOWED);
  EXPECT_EQ(container.add(Attribute::makeCategorical("color", "red")), NAME_NOT_FOUND);
  EXPECT_EQ(container.add(Attribute::makeBoolean("label", true)), TYPE_MISMATCH);
  EXPECT_EQ(container.size(), size);

  EXPECT_EQ(container.add(Attribute::makeNumeric("weight", 5.5)), SUCCESS);
  EXPECT_EQ(container.add(Attribute::makeCategorical("label", "dog")), SUCCESS);
  EXPECT_EQ(container.add(Attribute::makeBoolean("occluded", true)), SUCCESS);
  EXPECT_EQ(container.size(), size + 3);

  container.removeSchema();
  EXPECT_FALSE(container.hasSchema());
  EXPECT_EQ(container.add(Attribute::makeNumeric("weight", 10)), SUCCESS);
}

TEST_F(AttributeContainerTest, addContainerTest) {
  EXPECT_EQ(container.freezeSchema(), SUCCESS);
  AttributeContainer other;
  EXPECT_EQ(other.add(Attribute::makeNumeric("weight", 5)), SUCCESS);
  EXPECT_EQ(other.add(Attribute::makeNumeric("weight", 50)), SUCCESS);
  size_t size = container.size();
  EXPECT_EQ(container.addContainer(other), VALUE_NOT_ALLOWED);
  EXPECT_EQ(container.size(), size);

  AttributeContainer valid;
  EXPECT_EQ(valid.add(Attribute::makeNumeric("weight", 5)), SUCCESS);
  EXPECT_EQ(valid.add(Attribute::makeCategorical("label", "cat")), SUCCESS);
  EXPECT_EQ(container.addContainer(valid), SUCCESS);
  EXPECT_EQ(container.size(), size + 2);
  EXPECT_EQ(container[size + 1], Attribute::makeCategorical("label", "cat"));

  EXPECT_EQ(container.addContainer(container), SUCCESS);
  EXPECT_EQ(container.size(), 2 * (size + 2));
}

TEST_F(AttributeContainerTest, setSchemaTest) {
  auto schema = make_shared<AttributeContainerSchema>();
  schema->setAttributeSchema(AttributeSchema::makeCategorical("label", {"cat"}));
  EXPECT_EQ(container.setSchema(schema), NAME_NOT_FOUND);
  EXPECT_FALSE(container.hasSchema());

  schema->setAttributeSchema(AttributeSchema::makeNumeric("weight", 0, 10));
  schema->setAttributeSchema(AttributeSchema::makeBoolean("occluded"));
  EXPECT_EQ(container.setSchema(schema), VALUE_NOT_ALLOWED); // "dog" isn't allowed
  EXPECT_FALSE(container.hasSchema());

  schema->setAttributeSchema(AttributeSchema::makeCategorical("label", {"cat", "dog"}));
  EXPECT_EQ(container.setSchema(schema), SUCCESS);
  EXPECT_EQ(container.getSchema(), schema);

  // shared schemas apply to every container using them
  AttributeContainer other(schema);
  EXPECT_EQ(other.add(Attribute::makeNumeric("weight", 11)), VALUE_NOT_ALLOWED);
  EXPECT_EQ(other.add(Attribute::makeNumeric("weight", 10)), SUCCESS);
}

TEST_F(AttributeContainerTest, containerSchemaTest) {
  AttributeContainerSchema schema;
  EXPECT_EQ(schema.addAttribute(Attribute::makeNumeric("weight", 1)), SUCCESS);
  // all or nothing
  EXPECT_EQ(
      schema.addAttributes(
          {Attribute::makeCategorical("label", "cat"), Attribute::makeCategorical("weight", "x")}),
      TYPE_MISMATCH);
  EXPECT_FALSE(schema.hasAttribute("label"));

  AttributeContainerSchema active;
  vector<Attribute> mixed = {
      Attribute::makeNumeric("weight", 1), Attribute::makeBoolean("weight", true)};
  EXPECT_EQ(AttributeContainerSchema::buildActiveSchema(mixed, active), TYPE_MISMATCH);
  EXPECT_TRUE(active.empty());

  AttributeContainerSchema other;
  EXPECT_EQ(other.addAttribute(Attribute::makeNumeric("weight", 8)), SUCCESS);
  EXPECT_EQ(other.addAttribute(Attribute::makeCategorical("label", "cat")), SUCCESS);
  EXPECT_EQ(schema.mergeSchema(other), SUCCESS);
  EXPECT_TRUE(schema.hasAttribute("label"));
  EXPECT_TRUE(schema.isValidAttribute(Attribute::makeNumeric("weight", 5)));
  EXPECT_FALSE(schema.isValidAttribute(Attribute::makeNumeric("weight", 9)));

  AttributeContainerSchema conflicting;
  EXPECT_EQ(conflicting.addAttribute(Attribute::makeCategorical("color", "red")), SUCCESS);
  EXPECT_EQ(conflicting.addAttribute(Attribute::makeBoolean("weight", true)), SUCCESS);
  EXPECT_EQ(schema.mergeSchema(conflicting), TYPE_MISMATCH);
  EXPECT_FALSE(schema.hasAttribute("color"));
}

TEST_F(AttributeContainerTest, jsonTest) {
  AttributeContainer copy;
  EXPECT_EQ(AttributeContainer::fromJson(container.toJson(), copy), SUCCESS);
  EXPECT_EQ(copy.getAttributes(), container.getAttributes());
  EXPECT_FALSE(copy.hasSchema());

  EXPECT_EQ(container.freezeSchema(), SUCCESS);
  string json = container.toJson(JsonFormat::Pretty);
  EXPECT_EQ(AttributeContainer::fromJson(json, copy), SUCCESS);
  EXPECT_EQ(copy.getAttributes(), container.getAttributes());
  ASSERT_TRUE(copy.hasSchema());
  EXPECT_EQ(*copy.getSchema(), *container.getSchema());

  AttributeContainerSchema schemaCopy;
  EXPECT_EQ(
      AttributeContainerSchema::fromJson(container.getSchema()->toJson(), schemaCopy), SUCCESS);
  EXPECT_EQ(schemaCopy, *container.getSchema());

  // a stored schema validates the stored attributes
  const string invalid = R"({
    "attrs": [{"type": "eta.core.data.NumericAttribute", "name": "weight", "value": 12}],
    "schema": {"schema": {"weight": {
        "type": "eta.core.data.NumericAttribute", "name": "weight", "uuid": "u", "range": [0, 10]
    }}}
  })";
  EXPECT_EQ(AttributeContainer::fromJson(invalid, copy), VALUE_NOT_ALLOWED);
  EXPECT_EQ(AttributeContainer::fromJson(R"({"attributes": []})", copy), INVALID_JSON);
  EXPECT_EQ(copy.getAttributes(), container.getAttributes());
}

TEST_F(AttributeContainerTest, jsonFileTest) {
  const string path = os::pathJoin(os::getTempFolder(), "attributes.json");
  EXPECT_EQ(container.writeJsonFile(path), SUCCESS);
  AttributeContainer copy;
  EXPECT_EQ(AttributeContainer::readJsonFile(path, copy), SUCCESS);
  EXPECT_EQ(copy.getAttributes(), container.getAttributes());
  EXPECT_EQ(os::remove(path), 0);
  EXPECT_EQ(AttributeContainer::readJsonFile(path, copy), FILE_NOT_FOUND);
}

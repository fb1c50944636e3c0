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
#include <limits>

#include <gtest/gtest.h>

#include <fmt/format.h>

#include <eta/DataRecords.h>
#include <eta/ErrorCode.h>
#include <eta/os/Utils.h>

using namespace std;
using namespace eta;

namespace {

struct DataRecordsTest : testing::Test {
  DataRecordsTest() {
    const char* labels[] = {"cat", "dog", "cat", "dog", "cat"};
    for (size_t k = 0; k < 5; ++k) {
      auto record = LabeledVideoRecord::make(fmt::format("video{}.mp4", k), labels[k]);
      EXPECT_EQ(records.add(record), SUCCESS);
    }
  }

  DataRecords records{LabeledVideoRecord::getRecordKind()};
};

vector<string> getVideoPaths(const DataRecords& records) {
  vector<string> paths;
  for (const auto& record : records) {
    paths.push_back(dynamic_cast<const LabeledVideoRecord&>(*record).getVideoPath());
  }
  return paths;
}

} // namespace

TEST_F(DataRecordsTest, recordTest) {
  auto record = LabeledVideoRecord::make("a.mp4", "cat");
  EXPECT_EQ(record->getVideoPath(), "a.mp4");
  EXPECT_EQ(record->getLabel(), "cat");
  EXPECT_FALSE(record->hasGroup());
  FieldValue value;
  EXPECT_EQ(record->getField("group", value), FIELD_NOT_FOUND);

  // present null is different from absent
  EXPECT_EQ(record->setField("group", FieldValue()), SUCCESS);
  EXPECT_TRUE(record->hasGroup());
  EXPECT_EQ(record->getField("group", value), SUCCESS);
  EXPECT_TRUE(value.isNull());
  EXPECT_EQ(record->toJson(), R"({"group":null,"label":"cat","video_path":"a.mp4"})");

  EXPECT_EQ(record->clearField("group"), SUCCESS);
  EXPECT_FALSE(record->hasGroup());
  EXPECT_EQ(record->clearField("group"), FIELD_NOT_FOUND);
  EXPECT_EQ(record->clearField("label"), INVALID_REQUEST);
  EXPECT_EQ(record->setField("", 1), INVALID_PARAMETER);

  auto grouped = LabeledVideoRecord::make("b.mp4", "dog", "b");
  EXPECT_EQ(grouped->getGroup(), "b");
  EXPECT_EQ(grouped->toJson(), R"({"group":"b","label":"dog","video_path":"b.mp4"})");
}

TEST_F(DataRecordsTest, recordKindTest) {
  auto kind = make_shared<DataRecordKind>(
      "my.app.Sample", vector<string>{"id"}, vector<string>{"score"}, vector<string>{"cache"});
  EXPECT_TRUE(kind->isRequired("id"));
  EXPECT_TRUE(kind->isOptional("score"));
  EXPECT_TRUE(kind->isExcluded("cache"));

  shared_ptr<DataRecord> record = DataRecordKind::makeRecord(kind);
  EXPECT_EQ(record->checkRequiredFields(), MISSING_FIELD);
  EXPECT_EQ(record->setField("id", 7), SUCCESS);
  EXPECT_EQ(record->setField("cache", "big"), SUCCESS);
  EXPECT_EQ(record->checkRequiredFields(), SUCCESS);
  // excluded fields are never serialized
  EXPECT_EQ(record->toJson(), R"({"id":7})");

  JDocument doc;
  ASSERT_TRUE(jParse(doc, string(R"({"id": 3, "score": [1, 2], "cache": 1, "other": 2})")));
  shared_ptr<DataRecord> parsed;
  EXPECT_EQ(DataRecord::fromJValue(kind, doc, parsed), SUCCESS);
  ASSERT_TRUE(parsed);
  EXPECT_EQ(parsed->getFields().size(), 2);
  EXPECT_EQ(*parsed->findField("id"), FieldValue(3));
  EXPECT_EQ(parsed->findField("score")->getType(), FieldType::Json);
  EXPECT_EQ(parsed->findField("score")->getString(), "[1,2]");
  EXPECT_FALSE(parsed->hasField("cache"));

  ASSERT_TRUE(jParse(doc, string(R"({"score": 2})")));
  EXPECT_EQ(DataRecord::fromJValue(kind, doc, parsed), MISSING_FIELD);

  // LabeledVideoRecord makes records of its own class
  shared_ptr<DataRecord> video = DataRecordKind::makeRecord(LabeledVideoRecord::getRecordKind());
  EXPECT_NE(dynamic_cast<LabeledVideoRecord*>(video.get()), nullptr);
}

TEST_F(DataRecordsTest, fieldValueTest) {
  EXPECT_EQ(FieldValue(2), FieldValue(2.0));
  EXPECT_LT(FieldValue(2), FieldValue(2.5));
  EXPECT_LT(FieldValue(), FieldValue(false));
  EXPECT_LT(FieldValue(true), FieldValue(0));
  EXPECT_LT(FieldValue(100), FieldValue("1"));
  EXPECT_LT(FieldValue("cat"), FieldValue("dog"));
  EXPECT_NE(FieldValue("1"), FieldValue(1));

  FieldValue value;
  EXPECT_EQ(FieldValue::fromJson(R"({"b": [1, 2.5, null], "a": "x"})", value), SUCCESS);
  EXPECT_EQ(value.getType(), FieldType::Json);
  EXPECT_EQ(value.toJson(), R"({"b":[1,2.5,null],"a":"x"})");
  EXPECT_EQ(FieldValue::fromJson("\"cat\"", value), SUCCESS);
  EXPECT_EQ(value, FieldValue("cat"));
  EXPECT_EQ(value.toJson(), "\"cat\"");
  EXPECT_EQ(FieldValue::fromJson("12", value), SUCCESS);
  EXPECT_EQ(value.getType(), FieldType::Int);
  EXPECT_EQ(value.asString(), "12");
  EXPECT_EQ(FieldValue::fromJson("{", value), INVALID_JSON);
  EXPECT_EQ(value.getInt(), 12);
}

TEST_F(DataRecordsTest, fieldValueOrderTest) {
  const double nan = std::nan("");
  EXPECT_EQ(FieldValue(nan), FieldValue(-nan));
  EXPECT_LT(FieldValue(3.0), FieldValue(nan));
  EXPECT_LT(FieldValue(5), FieldValue(nan));
  EXPECT_LT(FieldValue(HUGE_VAL), FieldValue(nan));
  EXPECT_LT(FieldValue(nan), FieldValue(""));
  EXPECT_FALSE(FieldValue(nan) < FieldValue(nan));

  // above 2^53, ints don't round to doubles
  const int64_t kBig = 9007199254740992; // 2^53
  EXPECT_EQ(FieldValue(kBig), FieldValue(9007199254740992.0));
  EXPECT_LT(FieldValue(9007199254740992.0), FieldValue(kBig + 1));
  EXPECT_NE(FieldValue(kBig + 1), FieldValue(9007199254740992.0));
  EXPECT_LT(FieldValue(numeric_limits<int64_t>::max()), FieldValue(9223372036854775808.0));
  EXPECT_LT(FieldValue(-HUGE_VAL), FieldValue(numeric_limits<int64_t>::min()));
  EXPECT_EQ(FieldValue(numeric_limits<int64_t>::min()), FieldValue(-9223372036854775808.0));
  EXPECT_LT(FieldValue(-3), FieldValue(-2.5));
  EXPECT_LT(FieldValue(-2.5), FieldValue(-2));
  EXPECT_EQ(FieldValue(0), FieldValue(-0.0));

  set<FieldValue> keys{FieldValue(kBig), FieldValue(kBig + 1), FieldValue(9007199254740992.0)};
  EXPECT_EQ(keys.size(), 2);
}

TEST_F(DataRecordsTest, nanLookupTest) {
  ASSERT_EQ(records[1]->setField("label", std::nan("")), SUCCESS);
  ASSERT_EQ(records[3]->setField("label", std::nan("")), SUCCESS);
  map<FieldValue, vector<size_t>> lookup;
  EXPECT_EQ(records.buildLookup("label", lookup), SUCCESS);
  ASSERT_EQ(lookup.size(), 2);
  EXPECT_EQ(lookup[FieldValue("cat")], (vector<size_t>{0, 2, 4}));
  EXPECT_EQ(lookup[FieldValue(std::nan(""))], (vector<size_t>{1, 3}));

  size_t count = 0;
  vector<FieldValue> keep{3.0};
  EXPECT_EQ(records.cull("label", &keep, nullptr, count), SUCCESS);
  EXPECT_EQ(count, 0);
}

TEST_F(DataRecordsTest, addTest) {
  EXPECT_EQ(records.size(), 5);
  EXPECT_EQ(records.getKind().getName(), "eta.core.data.LabeledVideoRecord");

  auto otherKind = make_shared<DataRecordKind>("my.app.Other", vector<string>{"label"});
  auto other = DataRecordKind::makeRecord(otherKind);
  EXPECT_EQ(other->setField("label", "cat"), SUCCESS);
  EXPECT_EQ(records.add(other), RECORD_KIND_MISMATCH);
  EXPECT_EQ(records.add(nullptr), INVALID_PARAMETER);

  auto incomplete = DataRecordKind::makeRecord(LabeledVideoRecord::getRecordKind());
  EXPECT_EQ(incomplete->setField("label", "cat"), SUCCESS);
  EXPECT_EQ(records.add(incomplete), MISSING_FIELD);
  EXPECT_EQ(records.size(), 5);

  DataRecords others(otherKind);
  EXPECT_EQ(others.add(other), SUCCESS);
  EXPECT_EQ(records.addContainer(others), RECORD_KIND_MISMATCH);
  EXPECT_EQ(records.addContainer(records), SUCCESS);
  EXPECT_EQ(records.size(), 10);
  records.clear();
  EXPECT_TRUE(records.empty());
}

TEST_F(DataRecordsTest, indexingTest) {
  set<FieldValue> keys;
  EXPECT_EQ(records.buildKeyset("label", keys), SUCCESS);
  EXPECT_EQ(keys, (set<FieldValue>{"cat", "dog"}));

  map<FieldValue, vector<size_t>> lookup;
  EXPECT_EQ(records.buildLookup("label", lookup), SUCCESS);
  EXPECT_EQ(lookup[FieldValue("cat")], (vector<size_t>{0, 2, 4}));
  EXPECT_EQ(lookup[FieldValue("dog")], (vector<size_t>{1, 3}));

  vector<FieldValue> values;
  EXPECT_EQ(records.slice("label", values), SUCCESS);
  ASSERT_EQ(values.size(), 5);
  for (const auto& entry : lookup) {
    for (size_t index : entry.second) {
      EXPECT_EQ(values[index], entry.first);
    }
  }

  map<FieldValue, vector<shared_ptr<DataRecord>>> subsets;
  EXPECT_EQ(records.buildSubsets("label", subsets), SUCCESS);
  ASSERT_EQ(subsets[FieldValue("dog")].size(), 2);
  // records are shared with the collection
  EXPECT_EQ(subsets[FieldValue("dog")][1], records[3]);

  EXPECT_EQ(records.buildKeyset("group", keys), FIELD_NOT_FOUND);
  EXPECT_EQ(keys.size(), 2);
  EXPECT_EQ(records.buildLookup("group", lookup), FIELD_NOT_FOUND);
  EXPECT_EQ(records.slice("group", values), FIELD_NOT_FOUND);
  EXPECT_EQ(records.buildSubsets("group", subsets), FIELD_NOT_FOUND);
}

TEST_F(DataRecordsTest, cullTest) {
  size_t count = 0;
  vector<FieldValue> cats{"cat"};
  EXPECT_EQ(records.cull("label", &cats, nullptr, count), SUCCESS);
  EXPECT_EQ(count, 3);
  EXPECT_EQ(getVideoPaths(records), (vector<string>{"video0.mp4", "video2.mp4", "video4.mp4"}));
}

TEST_F(DataRecordsTest, cullRemoveTest) {
  size_t count = 0;
  vector<FieldValue> cats{"cat"};
  EXPECT_EQ(records.cull("label", nullptr, &cats, count), SUCCESS);
  EXPECT_EQ(count, 2);
  EXPECT_EQ(getVideoPaths(records), (vector<string>{"video1.mp4", "video3.mp4"}));
}

TEST_F(DataRecordsTest, cullErrorsTest) {
  size_t count = 42;
  vector<FieldValue> cats{"cat"};
  vector<FieldValue> everything{"cat", "dog"};
  vector<FieldValue> nothing;
  EXPECT_EQ(records.cull("label", &cats, &cats, count), ARGUMENT_ERROR);
  EXPECT_EQ(records.cull("label", nullptr, nullptr, count), ARGUMENT_ERROR);
  EXPECT_EQ(records.cull("label", nullptr, &everything, count), ARGUMENT_ERROR);
  EXPECT_EQ(records.cull("label", &nothing, nullptr, count), ARGUMENT_ERROR);
  EXPECT_EQ(records.cull("group", &cats, nullptr, count), FIELD_NOT_FOUND);
  EXPECT_EQ(count, 42);
  EXPECT_EQ(records.size(), 5);
}

TEST_F(DataRecordsTest, subsetTest) {
  unique_ptr<DataRecords> subset;
  EXPECT_EQ(records.subsetFromIndices({4, 0, 4}, subset), SUCCESS);
  ASSERT_TRUE(subset);
  EXPECT_EQ(subset->getKindPtr(), records.getKindPtr());
  EXPECT_EQ(getVideoPaths(*subset), (vector<string>{"video4.mp4", "video0.mp4", "video4.mp4"}));
  EXPECT_EQ(records.size(), 5);

  unique_ptr<DataRecords> invalid;
  EXPECT_EQ(records.subsetFromIndices({1, 5}, invalid), INDEX_OUT_OF_BOUNDS);
  EXPECT_FALSE(invalid);
}

TEST_F(DataRecordsTest, jsonTest) {
  ASSERT_EQ(records[1]->setField("group", "clips"), SUCCESS);
  string json = records.toJson();
  EXPECT_NE(json.find(R"("_RECORD_CLS":"eta.core.data.LabeledVideoRecord")"), string::npos);

  // the kind is found in the document
  unique_ptr<DataRecords> copy;
  EXPECT_EQ(DataRecords::fromJson(json, nullptr, copy), SUCCESS);
  ASSERT_TRUE(copy);
  EXPECT_EQ(copy->toJson(), json);
  EXPECT_EQ(copy->getKind().getName(), records.getKind().getName());
  const auto& video = dynamic_cast<const LabeledVideoRecord&>(*(*copy)[1]);
  EXPECT_EQ(video.getGroup(), "clips");
  EXPECT_FALSE(dynamic_cast<const LabeledVideoRecord&>(*(*copy)[0]).hasGroup());

  // without the kind in the document, it must be provided
  string anonymous = records.toJson(JsonFormat::Pretty, false);
  EXPECT_EQ(anonymous.find("_RECORD_CLS"), string::npos);
  EXPECT_EQ(DataRecords::fromJson(anonymous, nullptr, copy), MISSING_RECORD_KIND);
  EXPECT_EQ(
      DataRecords::fromJson(anonymous, LabeledVideoRecord::getRecordKind(), copy), SUCCESS);
  EXPECT_EQ(copy->size(), 5);

  EXPECT_EQ(
      DataRecords::fromJson(R"({"records": [], "_RECORD_CLS": "my.app.Unknown"})", nullptr, copy),
      MISSING_RECORD_KIND);
  EXPECT_EQ(
      DataRecords::fromJson(
          R"({"records": [{"label": "cat"}], "_RECORD_CLS": "eta.core.data.LabeledVideoRecord"})",
          nullptr,
          copy),
      MISSING_FIELD);
  EXPECT_EQ(copy->size(), 5);
}

TEST_F(DataRecordsTest, addJsonTest) {
  const string json = R"({"records": [
    {"video_path": "video5.mp4", "label": "bird", "group": null},
    {"video_path": "video6.mp4", "label": "cat", "extra": 1}
  ]})";
  EXPECT_EQ(records.addJson(json), SUCCESS);
  ASSERT_EQ(records.size(), 7);
  EXPECT_TRUE(dynamic_cast<const LabeledVideoRecord&>(*records[5]).hasGroup());
  EXPECT_FALSE(records[6]->hasField("extra"));

  // all or nothing
  const string broken = R"({"records": [
    {"video_path": "video7.mp4", "label": "cat"},
    {"video_path": "video8.mp4"}
  ]})";
  EXPECT_EQ(records.addJson(broken), MISSING_FIELD);
  EXPECT_EQ(records.size(), 7);

  auto otherKind = make_shared<DataRecordKind>("my.app.Other", vector<string>{"label"});
  EXPECT_EQ(records.addJson(R"({"records": [{"label": "x"}]})", otherKind), RECORD_KIND_MISMATCH);
  EXPECT_EQ(records.size(), 7);
}

TEST_F(DataRecordsTest, jsonFileTest) {
  const string path = os::pathJoin(os::getTempFolder(), kDefaultDataRecordsFilename);
  EXPECT_EQ(records.writeJsonFile(path), SUCCESS);
  unique_ptr<DataRecords> copy;
  EXPECT_EQ(DataRecords::readJsonFile(path, nullptr, copy), SUCCESS);
  EXPECT_EQ(copy->toJson(), records.toJson());

  EXPECT_EQ(records.addJsonFile(path), SUCCESS);
  EXPECT_EQ(records.size(), 10);
  EXPECT_EQ(os::remove(path), 0);
  EXPECT_EQ(records.addJsonFile(path), FILE_NOT_FOUND);
}

TEST_F(DataRecordsTest, registryTest) {
  DataRecordKindRegistry& registry = DataRecordKindRegistry::get();
  shared_ptr<const DataRecordKind> kind;
  EXPECT_EQ(registry.getKind("eta.core.data.LabeledVideoRecord", kind), SUCCESS);
  EXPECT_EQ(kind, LabeledVideoRecord::getRecordKind());
  EXPECT_EQ(registry.getKind("my.app.Clip", kind), MISSING_RECORD_KIND);

  auto clipKind = make_shared<DataRecordKind>(
      "my.app.Clip", vector<string>{"path"}, vector<string>{"start", "end"});
  EXPECT_EQ(registry.registerKind(clipKind), SUCCESS);
  EXPECT_EQ(registry.registerKind(nullptr), INVALID_PARAMETER);

  unique_ptr<DataRecords> clips;
  EXPECT_EQ(
      DataRecords::fromJson(
          R"({"records": [{"path": "a.mp4", "start": 1.5}], "_RECORD_CLS": "my.app.Clip"})",
          nullptr,
          clips),
      SUCCESS);
  ASSERT_EQ(clips->size(), 1);
  EXPECT_EQ(*(*clips)[0]->findField("start"), FieldValue(1.5));
  EXPECT_FALSE((*clips)[0]->hasField("end"));
}

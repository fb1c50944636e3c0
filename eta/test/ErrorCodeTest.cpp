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

#include <cerrno>

#include <string>

#include <gtest/gtest.h>

#include <eta/os/Platform.h>

#include <eta/ErrorCode.h>

using namespace eta;

namespace {

struct ErrorCodeTest : testing::Test {};

} // namespace

TEST_F(ErrorCodeTest, testErrorCode) {
  EXPECT_EQ(ErrorCode::SUCCESS, 0);

#if IS_APPLE_PLATFORM()
  EXPECT_EQ(ErrorCode::FAILURE, 200000);
#elif IS_WINDOWS_PLATFORM()
  EXPECT_EQ(ErrorCode::FAILURE, 1 << 29);
#elif IS_LINUX_PLATFORM()
  EXPECT_EQ(ErrorCode::FAILURE, 1000);
#endif

  EXPECT_EQ(errorCodeToMessage(SUCCESS), "Success");
  EXPECT_EQ(errorCodeToMessage(TYPE_MISMATCH), "Attribute type doesn't match the schema's type");
  EXPECT_EQ(
      errorCodeToMessage(IMMUTABLE_BOUNDS), "Can't change the bounds of an immutable sequence");
  EXPECT_EQ(errorCodeToMessage(MISSING_RECORD_KIND), "Record kind not specified");
}

TEST_F(ErrorCodeTest, allCodesHaveMessages) {
  for (int code = FAILURE; code <= RECORD_KIND_MISMATCH; ++code) {
    EXPECT_EQ(errorCodeToMessage(code).find("<Unknown error code"), std::string::npos) << code;
  }
  const int unknownCode = RECORD_KIND_MISMATCH + 1000;
  EXPECT_EQ(
      errorCodeToMessage(unknownCode),
      "<Unknown error code '" + std::to_string(unknownCode) + "'>");
  EXPECT_EQ(
      errorCodeToMessageWithCode(INVALID_SEQUENCE_PATTERN),
      "Sequence pattern needs exactly one integer placeholder (#" +
          std::to_string(INVALID_SEQUENCE_PATTERN) + ")");
}

TEST_F(ErrorCodeTest, systemErrors) {
  EXPECT_FALSE(errorCodeToMessage(ENOENT).empty());
  EXPECT_EQ(errorCodeToMessage(ENOENT).find("<Unknown error code"), std::string::npos);
}

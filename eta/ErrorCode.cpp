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

#include <eta/ErrorCode.h>

#include <map>
#include <string>

#include <fmt/format.h>

#include <eta/os/Utils.h>

using namespace std;

namespace {
const char* getErrorName(int errorCode) {
  static const map<int, const char*> sRegistry = {
      {eta::SUCCESS, "Success"},
      {eta::FAILURE, "Misc error"},
      {eta::INVALID_PARAMETER, "Invalid parameter"},
      {eta::INVALID_REQUEST, "Invalid request"},
      {eta::FILE_NOT_FOUND, "File not found"},
      {eta::READ_ERROR, "Read error: failed to read data"},
      {eta::INVALID_JSON, "Invalid json document"},

      {eta::VALUE_PARSE_ERROR, "Value can't be parsed as the attribute's type"},
      {eta::UNKNOWN_VARIANT, "Unknown attribute type"},
      {eta::NAME_NOT_FOUND, "Attribute name not allowed by the schema"},
      {eta::TYPE_MISMATCH, "Attribute type doesn't match the schema's type"},
      {eta::VALUE_NOT_ALLOWED, "Attribute value not allowed by the schema"},

      {eta::INVALID_SEQUENCE_PATTERN, "Sequence pattern needs exactly one integer placeholder"},
      {eta::PATTERN_MISMATCH, "No file matches the sequence pattern"},
      {eta::INVALID_INDEX, "Sequence indices must be nonnegative"},
      {eta::INDEX_OUT_OF_BOUNDS, "Index out of the sequence bounds"},
      {eta::IMMUTABLE_BOUNDS, "Can't change the bounds of an immutable sequence"},

      {eta::ARGUMENT_ERROR, "Invalid or conflicting arguments"},
      {eta::FIELD_NOT_FOUND, "Record field not found"},
      {eta::MISSING_FIELD, "Required record field missing"},
      {eta::MISSING_RECORD_KIND, "Record kind not specified"},
      {eta::RECORD_KIND_MISMATCH, "Record kinds don't match"},
  };
  auto iter = sRegistry.find(errorCode);
  return iter != sRegistry.end() ? iter->second : nullptr;
}
} // namespace

namespace eta {

string errorCodeToMessage(int errorCode) {
  if (errorCode < 0 || (errorCode > 0 && errorCode < kPlatformUserErrorsStart)) {
    return os::fileErrorToString(errorCode);
  }
  const char* errorName = getErrorName(errorCode);
  if (errorName != nullptr) {
    return errorName;
  }
  return fmt::format("<Unknown error code '{}'>", errorCode);
}

string errorCodeToMessageWithCode(int errorCode) {
  return errorCodeToMessage(errorCode) + " (#" + to_string(errorCode) + ")";
}

} // namespace eta

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

#include <string>

#include <eta/os/Platform.h>

namespace eta {

#if IS_APPLE_PLATFORM()
// Largest error number is 100102 kPOSIXErrorEOPNOTSUPP
const int kPlatformUserErrorsStart = 200000;
#elif IS_WINDOWS_PLATFORM()
const int kPlatformUserErrorsStart = 1 << 29; // bit 29 is set for user errors
#else
const int kPlatformUserErrorsStart = 1000; // Errorno is 131
#endif

/// Status codes returned by the eta APIs. 0 means success.
/// Positive values below kPlatformUserErrorsStart are OS errors (errno values).
enum ErrorCode : int {
  SUCCESS = 0,

  FAILURE = kPlatformUserErrorsStart,
  INVALID_PARAMETER,
  INVALID_REQUEST,
  FILE_NOT_FOUND,
  READ_ERROR,
  INVALID_JSON,

  // Attributes & schemas
  VALUE_PARSE_ERROR,
  UNKNOWN_VARIANT,
  NAME_NOT_FOUND,
  TYPE_MISMATCH,
  VALUE_NOT_ALLOWED,

  // File sequences
  INVALID_SEQUENCE_PATTERN,
  PATTERN_MISMATCH,
  INVALID_INDEX,
  INDEX_OUT_OF_BOUNDS,
  IMMUTABLE_BOUNDS,

  // Records
  ARGUMENT_ERROR,
  FIELD_NOT_FOUND,
  MISSING_FIELD,
  MISSING_RECORD_KIND,
  RECORD_KIND_MISMATCH,
};

/// Convert an int error code into a human readable string for logging.
/// This API should work with any int error code returned by any eta API.
/// @param errorCode: an error code returned by any eta API.
/// @return A string that describes the error.
std::string errorCodeToMessage(int errorCode);

/// Convert an int error code into a human readable string for logging.
/// This version includes the error code's numeric value.
/// @param errorCode: an error code returned by any eta API.
/// @return A string that describes the error.
std::string errorCodeToMessageWithCode(int errorCode);

} // namespace eta

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

// Status code helpers. The _LOG_ variants need DEFAULT_LOG_CHANNEL & <logging/Log.h>,
// as well as <eta/ErrorCode.h>.

#define IF_ERROR_LOG_AND_RETURN(operation_)               \
  do {                                                    \
    int operationError_ = operation_;                     \
    if (operationError_ != 0) {                           \
      ETA_LOGE(                                           \
          "{} failed: {}, {}",                            \
          #operation_,                                    \
          operationError_,                                \
          eta::errorCodeToMessage(operationError_));      \
      return operationError_;                             \
    }                                                     \
  } while (false)

#define IF_ERROR_RETURN(operation_)   \
  do {                                \
    int operationError_ = operation_; \
    if (operationError_ != 0) {       \
      return operationError_;         \
    }                                 \
  } while (false)

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

namespace eta {
namespace logging {

enum class Level {
  Error = 0,
  Warning = 1,
  Info = 2,
  Debug = 3,
};

/// Set the global log level: messages with a less important level are not printed.
/// Until this is called, the level comes from the ETA_LOG_LEVEL environment variable
/// ("error", "warning", "info" or "debug"), or Info if it's not set.
void setGlobalLogLevel(Level level);
Level getGlobalLogLevel();

} // namespace logging
} // namespace eta

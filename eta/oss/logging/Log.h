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

#include <fmt/core.h>

#include "LogLevel.h"

namespace eta {
namespace logging {

/// Logging backend: redirect where you need, depending on the log level and your preferences.
/// Messages less important than the global log level are dropped.
void log(Level level, const char* channel, const std::string& message);

} // namespace logging
} // namespace eta

#ifdef DEFAULT_LOG_CHANNEL
#define ETA_LOG_DEFAULT(level, ...) \
  eta::logging::log(level, DEFAULT_LOG_CHANNEL, fmt::format(__VA_ARGS__))

#define ETA_LOGD(...) ETA_LOG_DEFAULT(eta::logging::Level::Debug, __VA_ARGS__)
#define ETA_LOGI(...) ETA_LOG_DEFAULT(eta::logging::Level::Info, __VA_ARGS__)
#define ETA_LOGW(...) ETA_LOG_DEFAULT(eta::logging::Level::Warning, __VA_ARGS__)
#define ETA_LOGE(...) ETA_LOG_DEFAULT(eta::logging::Level::Error, __VA_ARGS__)
#endif

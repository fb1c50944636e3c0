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

#include <cstdint>
#include <cstdio>
#include <string>

#include <eta/os/Platform.h>

/// Mini-OS abstraction layer. Only eta should use these.
/// Encapsulates the file system implementation (boost::filesystem).

namespace eta {
namespace os {

/// FILE helpers
std::FILE* fileOpen(const std::string& path, const char* modes);
int fileClose(std::FILE* file);
size_t fileRead(void* buf, size_t elementSize, size_t elementCount, std::FILE* file);
size_t fileWrite(const void* buf, size_t elementSize, size_t elementCount, std::FILE* file);

/// Read a whole text file.
/// @param path: path of the file to read.
/// @param outText: on exit, the content of the file, or empty on error.
/// @return A status code, 0 meaning success.
int readTextFile(const std::string& path, std::string& outText);

/// Create or overwrite a file with the given text.
/// @return A status code, 0 meaning success.
int writeTextFile(const std::string& path, const std::string& text);

/// Misc helpers
int remove(const std::string& path); // file or empty folder
std::string randomName(int length);
const std::string& getTempFolder();

/// Error helpers
int getLastFileError();
std::string fileErrorToString(int errnum);

/// Path joining helpers
std::string pathJoin(const std::string& a, const std::string& b);
std::string pathJoin(const std::string& a, const std::string& b, const std::string& c);

/// Directory making helpers
int makeDir(const std::string& dir);
int makeDirectories(const std::string& dir);

/// File path helpers
bool isDir(const std::string& path);
bool isFile(const std::string& path);
bool pathExists(const std::string& path);
int64_t getFileSize(const std::string& path);
std::string getFilename(const std::string& path);
/// Get the extension of a file name or path, including the dot, or "" if there is none.
std::string getExtension(const std::string& path);

std::string getCurrentExecutablePath();

} // namespace os
} // namespace eta

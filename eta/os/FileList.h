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
#include <vector>

namespace eta {
namespace os {

using std::string;
using std::vector;

/// Get all the files in a folder, and maybe its folders too.
/// @param path: file system path to list, that must be reachable.
/// @param inOutFiles: on exit, the list of files at that location is appended,
/// sorted the way a desktop file browser would sort them (see helpers::beforeFileName).
/// @param outFolders: on exit, if provided, set to the list of folders at that location.
/// @return A status code, 0 meaning success.
int getFilesAndFolders(
    const string& path,
    vector<string>& inOutFiles,
    vector<string>* outFolders = nullptr);

/// Get the names (not the paths) of the regular files directly inside a folder.
/// @param folder: the folder to list.
/// @param outNames: on exit, the sorted file names found.
/// @return A status code, 0 meaning success. A missing folder is an error.
int getFileNames(const string& folder, vector<string>& outNames);

} // namespace os
} // namespace eta

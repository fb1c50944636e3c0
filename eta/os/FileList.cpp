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

#include "FileList.h"

#include <cerrno>

#include <algorithm>

#include <boost/filesystem.hpp>

#include <eta/helpers/Strings.h>
#include <eta/os/Platform.h>

using namespace std;

namespace fs = boost::filesystem;

namespace eta {
namespace os {

static bool beforefileName(const std::string& left, const std::string& right) {
  return helpers::beforeFileName(left.c_str(), right.c_str());
}

int getFilesAndFolders(const string& path, vector<string>& inOutFiles, vector<string>* outFolders) {
  if (outFolders) {
    outFolders->clear();
  }
  boost::system::error_code ec;
  fs::path fspath(path);
  fs::file_status status = fs::status(fspath, ec);
  if (ec || !fs::exists(status)) {
    return ENOENT; // file not found
  } else if (status.type() == fs::file_type::directory_file) {
    for (fs::directory_iterator it(fspath, ec), eit; it != eit; it.increment(ec)) {
      if (ec) {
        return ec.value() != 0 ? ec.value() : -1;
      }
      if (!fs::is_symlink(it->symlink_status())) {
        status = it->status();
        if (status.type() == fs::file_type::regular_file) {
#if IS_APPLE_PLATFORM()
          if (it->path().filename() == ".DS_Store") {
            continue;
          }
#endif
          inOutFiles.emplace_back(it->path().generic_string());
        } else if (outFolders && status.type() == fs::file_type::directory_file) {
          outFolders->emplace_back(it->path().generic_string());
        }
      }
    }
    if (ec) {
      return ec.value() != 0 ? ec.value() : -1;
    }
  } else if (status.type() == fs::file_type::regular_file) {
    inOutFiles.emplace_back(path);
  }
  sort(inOutFiles.begin(), inOutFiles.end(), beforefileName);
  if (outFolders) {
    sort(outFolders->begin(), outFolders->end());
  }
  return 0;
}

int getFileNames(const string& folder, vector<string>& outNames) {
  outNames.clear();
  boost::system::error_code ec;
  if (!fs::is_directory(fs::path(folder), ec)) {
    return ENOTDIR;
  }
  vector<string> files;
  int status = getFilesAndFolders(folder, files);
  if (status != 0) {
    return status;
  }
  outNames.reserve(files.size());
  for (const string& file : files) {
    outNames.emplace_back(fs::path(file).filename().generic_string());
  }
  return 0;
}

} // namespace os
} // namespace eta

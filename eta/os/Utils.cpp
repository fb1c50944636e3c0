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

#include <eta/os/Utils.h>

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>

#include <algorithm>

#if IS_APPLE_PLATFORM()
#include <mach-o/dyld.h>
#elif IS_WINDOWS_PLATFORM()
#include <windows.h>
#else
#include <unistd.h>
#endif

#include <boost/filesystem.hpp>

#define DEFAULT_LOG_CHANNEL "OsUtils"
#include <logging/Log.h>

#include <eta/ErrorCode.h>

namespace fs = boost::filesystem;
using fs_error_code = boost::system::error_code;

using std::string;

namespace eta::os {

FILE* fileOpen(const string& path, const char* modes) {
  return ::fopen(path.c_str(), modes);
}

int fileClose(FILE* file) {
  return ::fclose(file);
}

size_t fileRead(void* buf, size_t elementSize, size_t elementCount, FILE* file) {
  return ::fread(buf, elementSize, elementCount, file);
}

size_t fileWrite(const void* buf, size_t elementSize, size_t elementCount, FILE* file) {
  return ::fwrite(buf, elementSize, elementCount, file);
}

int readTextFile(const string& path, string& outText) {
  outText.clear();
  int64_t size = getFileSize(path);
  if (size < 0) {
    return FILE_NOT_FOUND;
  }
  const int64_t kMaxReasonableTextFileSize = 500 * 1024 * 1024;
  if (size > kMaxReasonableTextFileSize) {
    ETA_LOGE("Text file '{}' is too large: {} bytes", path, size);
    return READ_ERROR;
  }
  FILE* file = fileOpen(path, "rb");
  if (file == nullptr) {
    return getLastFileError();
  }
  outText.resize(static_cast<size_t>(size));
  size_t readSize = size > 0 ? fileRead(&outText[0], 1, outText.size(), file) : 0;
  fileClose(file);
  if (readSize != outText.size()) {
    outText.clear();
    return READ_ERROR;
  }
  return SUCCESS;
}

int writeTextFile(const string& path, const string& text) {
  FILE* file = fileOpen(path, "wb");
  if (file == nullptr) {
    int error = getLastFileError();
    ETA_LOGE("Can't create '{}': {}", path, fileErrorToString(error));
    return error;
  }
  size_t writeSize = text.empty() ? 0 : fileWrite(text.data(), 1, text.size(), file);
  int error = writeSize == text.size() ? 0 : getLastFileError();
  if (fileClose(file) != 0 && error == 0) {
    error = getLastFileError();
  }
  return error;
}

int getLastFileError() {
  return errno;
}

int remove(const string& path) {
  return ::remove(path.c_str());
}

string fileErrorToString(int errnum) {
  return strerror(errnum);
}

string randomName(int length) {
  auto randchar = []() -> char {
    const char charset[] =
        "0123456789_"
        "abcdefghijklmnopqrstuvwxyz";
    const size_t max_index = (sizeof(charset) - 1);
    return charset[static_cast<size_t>(rand()) % max_index];
  };
  string str(length, 0);
  std::generate_n(str.begin(), length, randchar);
  return str;
}

const string& getTempFolder() {
  static string sUniqueFolderName = [] {
    fs::path tempDir = fs::temp_directory_path();
    string processName = getFilename(getCurrentExecutablePath());
    const size_t maxLength = 40;
    if (processName.length() > maxLength) {
      processName.resize(maxLength);
    }
    processName += '-';
    string uniqueFolderName;
    do {
      uniqueFolderName = (tempDir / (processName + randomName(10))).string();
    } while (pathExists(uniqueFolderName) || makeDir(uniqueFolderName) != 0);
    uniqueFolderName += '/';
    return uniqueFolderName;
  }();
  return sUniqueFolderName;
}

string pathJoin(const string& a, const string& b) {
  return (fs::path(a) / b).generic_string();
}

string pathJoin(const string& a, const string& b, const string& c) {
  return (fs::path(a) / b / c).generic_string();
}

int makeDir(const string& dir) {
  fs_error_code code;
  return fs::create_directory(fs::path(dir), code) ? 0 : code.value();
}

int makeDirectories(const string& dir) {
  fs_error_code code;
  fs::create_directories(dir, code);
  return code.value();
}

bool isDir(const string& path) {
  fs_error_code ec;
  return fs::is_directory(fs::path(path), ec);
}

bool isFile(const string& path) {
  fs_error_code ec;
  auto type = fs::status(fs::path(path), ec).type(); // This will traverse symlinks
  if (ec) { // Underlying OS API error - we cannot access it.
    return false;
  }
  return type == fs::file_type::regular_file;
}

bool pathExists(const string& path) {
  fs_error_code ec;
  auto type = fs::status(fs::path(path), ec).type(); // This will traverse symlinks
  if (ec) {
    return false; // Underlying OS API error - we cannot access it.
  }
  return type != fs::file_type::file_not_found;
}

int64_t getFileSize(const string& path) {
  fs_error_code ec;
  auto size = fs::file_size(fs::path(path), ec);
  if (ec) {
    return -1;
  }
  return static_cast<int64_t>(size);
}

// make 'path/to/folder' and 'path/to/folder/' mean the same thing
static fs::path getCleanedPath(const string& path) {
  fs::path fspath;
  if (path.empty() || (path.back() != '/' && path.back() != '\\')) {
    fspath = path;
  } else {
    string p{path};
    do {
      p.pop_back();
    } while (!p.empty() && (p.back() == '/' || p.back() == '\\'));
    fspath = p;
  }
  return fspath;
}

string getFilename(const string& path) {
  return getCleanedPath(path).filename().generic_string();
}

string getExtension(const string& path) {
  return fs::path(path).extension().generic_string();
}

string getCurrentExecutablePath() {
#if IS_WINDOWS_PLATFORM()
  const size_t kMaxPath = 1024;
  char exePath[kMaxPath];
  if (::GetModuleFileNameA(NULL, exePath, kMaxPath) <= 0) {
    exePath[0] = '\0';
  }
  return exePath;
#elif IS_APPLE_PLATFORM()
  char exePath[PATH_MAX];
  uint32_t len = PATH_MAX;
  if (_NSGetExecutablePath(exePath, &len) != 0) {
    exePath[0] = '\0'; // buffer too small (!)
  }
  return exePath;
#else
  char exePath[PATH_MAX];
  ssize_t readlinkLen = ::readlink("/proc/self/exe", exePath, PATH_MAX - 1);
  size_t len = readlinkLen < 0 ? 0 : static_cast<size_t>(readlinkLen);
  exePath[len] = '\0';
  return exePath;
#endif
}

} // namespace eta::os

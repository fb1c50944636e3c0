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

#include <gtest/gtest.h>

#include <eta/os/FileList.h>
#include <eta/os/Utils.h>

using namespace std;
using namespace eta;

static void createFile(const string& path, size_t size) {
  FILE* newFile = os::fileOpen(path, "wb");
  ASSERT_NE(newFile, nullptr);
  string s;
  s.assign(size, 'a');
  EXPECT_EQ(os::fileWrite(s.c_str(), size, 1, newFile), 1);
  os::fileClose(newFile);
}

struct FileListTest : testing::Test {
  FileListTest() {
    for (const string& folder : kTestFolders) {
      EXPECT_EQ(os::makeDirectories(os::pathJoin(kSubTestFolder, folder)), 0);
    }
    for (const auto& files : kTestFiles) {
      createFile(os::pathJoin(kSubTestFolder, files.first), files.second);
    }
  }

  const string kSubTestFolder = os::pathJoin(os::getTempFolder(), "file_list_test");
  const string kClipsFolder{"clips"};
  const vector<string> kTestFolders{kClipsFolder};
  const vector<pair<string, size_t>> kTestFiles = {
      {"frame-2.png", 1},
      {"frame-10.png", 2},
      {"labels.json", 3},
      {"clips/clip-1.mp4", 42},
  };
};

TEST_F(FileListTest, getFilesAndFoldersTest) {
  vector<string> files, folders;
  EXPECT_EQ(os::getFilesAndFolders(kSubTestFolder, files, &folders), 0);
  ASSERT_EQ(files.size(), 3);
  // sorted as a file browser would: 2 before 10
  EXPECT_EQ(os::getFilename(files[0]), "frame-2.png");
  EXPECT_EQ(os::getFilename(files[1]), "frame-10.png");
  EXPECT_EQ(os::getFilename(files[2]), "labels.json");
  ASSERT_EQ(folders.size(), 1);
  EXPECT_EQ(os::getFilename(folders[0]), kClipsFolder);

  vector<string> files2;
  EXPECT_EQ(os::getFilesAndFolders(kSubTestFolder, files2), 0);
  EXPECT_EQ(files, files2);

  vector<string> single;
  string clipPath = os::pathJoin(kSubTestFolder, "clips/clip-1.mp4");
  EXPECT_EQ(os::getFilesAndFolders(clipPath, single), 0);
  ASSERT_EQ(single.size(), 1);
  EXPECT_EQ(single[0], clipPath);

  vector<string> none;
  EXPECT_NE(os::getFilesAndFolders(os::pathJoin(kSubTestFolder, "missing"), none), 0);
  EXPECT_TRUE(none.empty());
}

TEST_F(FileListTest, getFileNamesTest) {
  vector<string> names;
  EXPECT_EQ(os::getFileNames(kSubTestFolder, names), 0);
  EXPECT_EQ(names, (vector<string>{"frame-2.png", "frame-10.png", "labels.json"}));

  EXPECT_EQ(os::getFileNames(os::pathJoin(kSubTestFolder, "clips"), names), 0);
  EXPECT_EQ(names, (vector<string>{"clip-1.mp4"}));

  EXPECT_NE(os::getFileNames(os::pathJoin(kSubTestFolder, "labels.json"), names), 0);
  EXPECT_TRUE(names.empty());
  EXPECT_NE(os::getFileNames(os::pathJoin(kSubTestFolder, "missing"), names), 0);
}

TEST_F(FileListTest, textFilesTest) {
  const string path = os::pathJoin(kSubTestFolder, "text.json");
  EXPECT_EQ(os::writeTextFile(path, "{\"a\": 1}"), 0);
  EXPECT_TRUE(os::isFile(path));
  EXPECT_EQ(os::getFileSize(path), 8);
  string text;
  EXPECT_EQ(os::readTextFile(path, text), 0);
  EXPECT_EQ(text, "{\"a\": 1}");
  EXPECT_EQ(os::getExtension(path), ".json");
  EXPECT_EQ(os::remove(path), 0);
  EXPECT_FALSE(os::pathExists(path));
  EXPECT_NE(os::readTextFile(path, text), 0);
  EXPECT_TRUE(text.empty());
}

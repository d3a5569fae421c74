// Copyright 2026 Google Inc. All Rights Reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include <ftw.h>
#include <gtest/gtest.h>
#include <json.h>
#include <pamedit_utils.h>
#include <stdio.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

#include <string>
#include <vector>

using std::string;
using std::vector;

using pamedit_utils::CopyFile;
using pamedit_utils::FileExists;
using pamedit_utils::FileName;
using pamedit_utils::IsDirectory;
using pamedit_utils::ListRegularFiles;
using pamedit_utils::ReadFile;
using pamedit_utils::RealPath;
using pamedit_utils::StringsToJson;
using pamedit_utils::ValidateServiceName;
using pamedit_utils::WriteFile;

static int RemoveEntry(const char *path, const struct stat *sb, int typeflag,
                       struct FTW *ftwbuf) {
  return remove(path);
}

class FilesTest : public ::testing::Test {
 protected:
  void SetUp() override {
    char tmpl[] = "/tmp/pamedit_utils_test.XXXXXX";
    ASSERT_NE(mkdtemp(tmpl), nullptr);
    dir_ = tmpl;
  }

  void TearDown() override {
    nftw(dir_.c_str(), RemoveEntry, 16, FTW_DEPTH | FTW_PHYS);
  }

  string dir_;
};

TEST(UtilsTest, TestFileName) {
  ASSERT_STREQ(FileName("/usr/sbin/pamedit"), "pamedit");
  ASSERT_STREQ(FileName("pamedit"), "pamedit");
  ASSERT_STREQ(FileName("./bin/pamedit"), "pamedit");
}

TEST(UtilsTest, TestValidateServiceName) {
  ASSERT_TRUE(ValidateServiceName("system-auth"));
  ASSERT_TRUE(ValidateServiceName("sshd"));
  ASSERT_TRUE(ValidateServiceName("common-session-noninteractive"));
  ASSERT_TRUE(ValidateServiceName("polkit-1"));
  ASSERT_TRUE(ValidateServiceName("runuser-l"));

  ASSERT_FALSE(ValidateServiceName(""));
  ASSERT_FALSE(ValidateServiceName(".hidden"));
  ASSERT_FALSE(ValidateServiceName("../shadow"));
  ASSERT_FALSE(ValidateServiceName("pam.d/sshd"));
  ASSERT_FALSE(ValidateServiceName("ssh d"));
}

TEST(UtilsTest, TestRealPathOfMissingPath) {
  ASSERT_EQ(RealPath("/nonexistent/pamedit/dir///"), "/nonexistent/pamedit/dir");
  ASSERT_EQ(RealPath("/"), "/");
}

TEST(UtilsTest, TestStringsToJson) {
  vector<string> values;
  values.push_back("login");
  values.push_back("sshd");
  string json = StringsToJson(values);

  json_object* root = json_tokener_parse(json.c_str());
  ASSERT_NE(root, nullptr);
  ASSERT_EQ(json_object_get_type(root), json_type_array);
  ASSERT_EQ(json_object_array_length(root), 2);
  ASSERT_STREQ(json_object_get_string(json_object_array_get_idx(root, 0)),
               "login");
  json_object_put(root);
}

TEST_F(FilesTest, TestWriteAndReadFile) {
  string path = dir_ + "/sshd";
  ASSERT_TRUE(WriteFile(path, "auth required pam_unix.so\n"));
  ASSERT_TRUE(FileExists(path));
  ASSERT_FALSE(IsDirectory(path));
  ASSERT_TRUE(IsDirectory(dir_));

  string content;
  ASSERT_TRUE(ReadFile(path, &content));
  ASSERT_EQ(content, "auth required pam_unix.so\n");
}

TEST_F(FilesTest, TestReadMissingFile) {
  string content;
  ASSERT_FALSE(ReadFile(dir_ + "/missing", &content));
  ASSERT_FALSE(FileExists(dir_ + "/missing"));
}

TEST_F(FilesTest, TestCopyFileKeepsBytesAndMode) {
  string from = dir_ + "/login";
  string to = dir_ + "/login.copy";
  string original = "auth\trequired\tpam_unix.so\n# no trailing newline";
  ASSERT_TRUE(WriteFile(from, original));
  ASSERT_EQ(chmod(from.c_str(), 0640), 0);

  ASSERT_TRUE(CopyFile(from, to));

  string copied;
  ASSERT_TRUE(ReadFile(to, &copied));
  ASSERT_EQ(copied, original);

  struct stat st;
  ASSERT_EQ(stat(to.c_str(), &st), 0);
  ASSERT_EQ(st.st_mode & 07777, 0640);
}

TEST_F(FilesTest, TestCopyMissingFileFails) {
  ASSERT_FALSE(CopyFile(dir_ + "/missing", dir_ + "/copy"));
}

TEST_F(FilesTest, TestListRegularFiles) {
  ASSERT_TRUE(WriteFile(dir_ + "/sshd", ""));
  ASSERT_TRUE(WriteFile(dir_ + "/login", ""));
  ASSERT_TRUE(WriteFile(dir_ + "/.hidden", ""));
  ASSERT_EQ(mkdir((dir_ + "/subdir").c_str(), 0755), 0);

  vector<string> names;
  ASSERT_TRUE(ListRegularFiles(dir_, &names));
  ASSERT_EQ(names.size(), 2);
  ASSERT_EQ(names[0], "login");
  ASSERT_EQ(names[1], "sshd");
}

TEST_F(FilesTest, TestListMissingDirectory) {
  vector<string> names;
  ASSERT_FALSE(ListRegularFiles(dir_ + "/missing", &names));
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}

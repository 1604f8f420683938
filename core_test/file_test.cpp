/**************************************************************************/
/*                                                                        */
/*                           SCPull Version 1.x                           */
/*               Copyright (C)2022, WWIV Software Services                */
/*                                                                        */
/*    Licensed  under the  Apache License, Version  2.0 (the "License");  */
/*    you may not use this  file  except in compliance with the License.  */
/*    You may obtain a copy of the License at                             */
/*                                                                        */
/*                http://www.apache.org/licenses/LICENSE-2.0              */
/*                                                                        */
/*    Unless  required  by  applicable  law  or agreed to  in  writing,   */
/*    software  distributed  under  the  License  is  distributed on an   */
/*    "AS IS"  BASIS, WITHOUT  WARRANTIES  OR  CONDITIONS OF ANY  KIND,   */
/*    either  express  or implied.  See  the  License for  the specific   */
/*    language governing permissions and limitations under the License.   */
/*                                                                        */
/**************************************************************************/
#include "core/file.h"
#include "core_test/file_helper.h"
#include "gtest/gtest.h"
#include <chrono>
#include <filesystem>
#include <string>
#include <sys/stat.h>

using std::string;
using namespace std::chrono;
using namespace scpull::core;
namespace fs = std::filesystem;

TEST(FileTest, DoesNotExist) {
  FileHelper file;
  const auto& tmp = file.TempDir();
  ASSERT_FALSE(tmp.empty());
  const auto fn = FilePath(tmp, "doesnotexist");
  EXPECT_FALSE(File::Exists(fn));
  File dne(fn);
  EXPECT_FALSE(dne.Exists());
  EXPECT_FALSE(File::Exists(""));
}

TEST(FileTest, Exists) {
  FileHelper file;
  ASSERT_TRUE(file.Mkdir("newdir"));
  const auto f = FilePath(file.TempDir(), "newdir");
  EXPECT_TRUE(File::Exists(f)) << f;
  EXPECT_TRUE(File::is_directory(f));
}

TEST(FileTest, Write_Read) {
  FileHelper helper;
  const auto path = helper.CreateTempFilePath("data.bin");
  {
    File f(path);
    ASSERT_TRUE(f.Open(File::modeWriteOnly | File::modeCreateFile | File::modeTruncate));
    EXPECT_TRUE(f.IsOpen());
    const string data("a\0b", 3);
    EXPECT_EQ(3, f.Write(data));
    EXPECT_EQ(2, f.Writeln("c"));
    EXPECT_TRUE(f.Flush());
  }
  EXPECT_EQ(string("a\0bc\n", 5), helper.ReadFile(path));

  File f(path);
  ASSERT_TRUE(f.Open(File::modeReadOnly));
  char buf[10]{};
  EXPECT_EQ(5, f.Read(buf, sizeof(buf)));
  EXPECT_EQ(5, f.length());
}

TEST(FileTest, Open_Truncate) {
  FileHelper helper;
  const auto path = helper.CreateTempFile("t.txt", "a much longer original");
  File f(path);
  ASSERT_TRUE(f.Open(File::modeWriteOnly | File::modeCreateFile | File::modeTruncate));
  f.Write("short");
  f.Close();
  EXPECT_EQ("short", helper.ReadFile(path));
}

TEST(FileTest, Open_Permissions) {
  FileHelper helper;
  const auto old_mask = umask(022);
  const auto path = helper.CreateTempFilePath("script.sh");
  {
    File f(path);
    ASSERT_TRUE(f.Open(File::modeWriteOnly | File::modeCreateFile, 0750));
  }
  umask(old_mask);
  EXPECT_EQ(0750, helper.Permissions(path));
}

TEST(FileTest, Open_MissingDirectory) {
  FileHelper helper;
  File f(FilePath(helper.Dir("nope"), "x.txt"));
  EXPECT_FALSE(f.Open(File::modeWriteOnly | File::modeCreateFile));
  EXPECT_FALSE(f.IsOpen());
  EXPECT_FALSE(f.last_error().empty());
}

TEST(FileTest, Flush_NotOpen) {
  FileHelper helper;
  File f(helper.CreateTempFilePath("x"));
  EXPECT_FALSE(f.Flush());
}

TEST(FileTest, Move) {
  FileHelper helper;
  const auto path = helper.CreateTempFilePath("m.txt");
  File f(path);
  ASSERT_TRUE(f.Open(File::modeWriteOnly | File::modeCreateFile));
  File other(std::move(f));
  EXPECT_TRUE(other.IsOpen());
  EXPECT_EQ(path, other.path());
}

TEST(FileTest, Mkdirs) {
  FileHelper helper;
  const auto path = helper.Dir("a/b/c");
  EXPECT_TRUE(File::mkdirs(path));
  EXPECT_TRUE(File::is_directory(path));
  // Already there.
  EXPECT_TRUE(File::mkdirs(path));
}

TEST(FileTest, Mkdirs_FileInTheWay) {
  FileHelper helper;
  const auto path = helper.CreateTempFile("plain", "x");
  EXPECT_FALSE(File::mkdirs(path));
  EXPECT_FALSE(File::mkdirs(path / "sub"));
}

TEST(FileTest, SetFilePermissions) {
  FileHelper helper;
  const auto path = helper.CreateTempFile("p.txt", "x");
  ASSERT_TRUE(File::SetFilePermissions(path, 0600));
  EXPECT_EQ(0600, helper.Permissions(path));
}

TEST(FileTest, SetFileTimes) {
  FileHelper helper;
  const auto path = helper.CreateTempFile("times.txt", "x");
  const auto mtime = system_clock::from_time_t(1700000000) + microseconds(250000);
  const auto atime = system_clock::from_time_t(1600000000);
  ASSERT_TRUE(File::set_file_times(path, atime, mtime));

  struct stat st {};
  ASSERT_EQ(0, stat(path.string().c_str(), &st));
  EXPECT_EQ(1700000000, st.st_mtim.tv_sec);
  EXPECT_EQ(250000000, st.st_mtim.tv_nsec);
  EXPECT_EQ(1600000000, st.st_atim.tv_sec);
}

TEST(FileTest, SetFileTimes_Missing) {
  FileHelper helper;
  EXPECT_FALSE(File::set_file_times(helper.Dir("missing"), system_clock::now(),
                                    system_clock::now()));
}

TEST(FileTest, FilePath) {
  EXPECT_EQ(fs::path("/a/b"), FilePath("/a", "b"));
  EXPECT_EQ(fs::path("b"), FilePath("", "b"));
}

TEST(FileTest, Absolute) {
  const auto cwd = File::current_directory();
  EXPECT_EQ(cwd / "x", File::absolute("x"));
  EXPECT_EQ(fs::path("/etc"), File::absolute("/etc"));
}

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
#include "core_test/file_helper.h"

#include "core/strings.h"
#include "gtest/gtest.h"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <vector>

using std::string;
using namespace scpull::strings;

// Base test directory.
std::filesystem::path FileHelper::basedir_;

FileHelper::FileHelper() {
  const auto* const test_info = ::testing::UnitTest::GetInstance()->current_test_info();
  const auto dir = StrCat(test_info->test_case_name(), "_", test_info->name());
  tmp_ = CreateTempDir(dir);
}

std::filesystem::path FileHelper::Dir(const string& name) const { return tmp_ / name; }

bool FileHelper::Mkdir(const string& name) const {
  std::error_code ec;
  std::filesystem::create_directories(Dir(name), ec);
  return !ec;
}

// static
void FileHelper::set_test_tempdir(const std::string& d) noexcept {
  std::error_code ec;
  basedir_ = std::filesystem::canonical(d, ec);
}

// static
std::filesystem::path FileHelper::GetTestTempDir() {
  if (!basedir_.empty()) {
    return basedir_;
  }
  const auto temp_path = canonical(std::filesystem::temp_directory_path());
  auto path = temp_path / "scpull_test_out";
  if (!exists(path)) {
    create_directories(path);
  }
  return path;
}

// static
std::filesystem::path FileHelper::CreateTempDir(const string& base) {
  const auto temp_path = GetTestTempDir();
  const auto templ = StrCat(temp_path.string(), "/", base, ".XXXXXX");
  std::vector<char> local_dir_template(templ.begin(), templ.end());
  local_dir_template.push_back('\0');
  if (const auto* result = mkdtemp(local_dir_template.data())) {
    return std::filesystem::path{result};
  }
  throw std::runtime_error(StrCat("Unable to create temp dir: ", templ, "; errno: ", errno));
}

std::filesystem::path FileHelper::CreateTempFilePath(const string& name) const {
  return TempDir() / name;
}

std::filesystem::path FileHelper::CreateTempFile(const string& name, const string& contents) {
  const auto path = CreateTempFilePath(name);
  auto* fp = fopen(path.string().c_str(), "wb");
  if (!fp) {
    throw std::runtime_error(StrCat("Unable to create file: ", path.string()));
  }
  fwrite(contents.data(), 1, contents.size(), fp);
  fclose(fp);
  return path;
}

// N.B.: We don't use File here since we are testing File with this helper.
string FileHelper::ReadFile(const std::filesystem::path& name) const {
  const auto name_string = name.string();
  auto* fp = fopen(name_string.c_str(), "rb");
  if (!fp) {
    const auto msg = StrCat("Unable to open file: ", name_string, "; errno: ", errno);
    throw std::runtime_error(msg);
  }
  string contents;
  fseek(fp, 0, SEEK_END);
  contents.resize(static_cast<string::size_type>(ftell(fp)));
  rewind(fp);
  const auto num_read = fread(&contents[0], 1, contents.size(), fp);
  contents.resize(num_read);
  fclose(fp);
  return contents;
}

int FileHelper::Permissions(const std::filesystem::path& name) const {
  struct stat st {};
  if (stat(name.string().c_str(), &st) != 0) {
    return -1;
  }
  return static_cast<int>(st.st_mode & 07777);
}

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
#include "core/inifile.h"

#include "core/file.h"
#include "core/log.h"
#include "core/strings.h"
#include <cctype>
#include <fstream>
#include <initializer_list>
#include <map>
#include <string>
#include <utility>

using namespace scpull::strings;

namespace scpull::core {

static bool StringToBoolean(const std::string& s) {
  if (s.empty()) {
    return false;
  }
  const auto ch = std::toupper(static_cast<unsigned char>(s.front()));
  return ch == 'Y' || ch == 'T' || ch == '1';
}

static bool ParseIniFile(const std::filesystem::path& filename,
                         std::map<std::string, std::string>& data) {
  if (!File::Exists(filename)) {
    // No need to try to open a file that does not exist.
    return false;
  }

  data.clear();
  std::ifstream file(filename);
  if (!file) {
    LOG(WARNING) << "Unable to open INI file: " << filename.string();
    return false;
  }

  std::string section;
  std::string line;
  while (std::getline(file, line)) {
    StringTrim(&line);
    if (line.empty() || line.front() == '#') {
      continue;
    }

    if (line.front() == '[' && line.back() == ']') {
      // Section header.
      section = StringTrim(line.substr(1, line.size() - 2));
      continue;
    }
    if (line.find(';') != std::string::npos) {
      // we have a comment, remove it.
      line.erase(line.find(';'));
    }

    const auto equals = line.find('=');
    if (equals == std::string::npos) {
      // not a line of the form key = value [; comment]
      continue;
    }
    const auto key = StringTrim(line.substr(0, equals));
    auto value = StringTrim(line.substr(equals + 1));
    // Trim surrounding double quotes.
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
      value = value.substr(1, value.size() - 2);
    }
    data[StrCat(section, ".", key)] = value;
  }
  return true;
}

IniFile::IniFile(std::filesystem::path path,
                 const std::initializer_list<const std::string> sections)
  : path_(std::move(path)) {
  for (const auto& s : sections) {
    sections_.emplace_back(s);
  }
  open_ = ParseIniFile(path_, data_);
}

std::optional<std::string> IniFile::GetValue(const std::string& raw_key) const {
  for (const auto& section : sections_) {
    const auto full_key = StrCat(section, ".", raw_key);
    if (const auto& it = data_.find(full_key); it != data_.end()) {
      return it->second;
    }
  }
  return std::nullopt;
}

bool IniFile::contains(const std::string& key) const { return GetValue(key).has_value(); }

std::string IniFile::GetStringValue(const std::string& key,
                                    const std::string& default_value) const {
  if (const auto s = GetValue(key)) {
    return s.value();
  }
  return default_value;
}

bool IniFile::GetBooleanValue(const std::string& key, bool default_value) const {
  if (const auto s = GetValue(key)) {
    return StringToBoolean(s.value());
  }
  return default_value;
}

long IniFile::GetNumericValueT(const std::string& key, long default_value) const {
  if (const auto s = GetValue(key)) {
    return to_number<long>(s.value());
  }
  return default_value;
}

template <>
std::string IniFile::value<std::string>(const std::string& key,
                                        const std::string& default_value) const {
  return GetStringValue(key, default_value);
}

template <>
std::string IniFile::value<std::string>(const std::string& key) const {
  return GetStringValue(key, "");
}

template <>
bool IniFile::value<bool>(const std::string& key, const bool& default_value) const {
  return GetBooleanValue(key, default_value);
}

template <>
bool IniFile::value<bool>(const std::string& key) const {
  return GetBooleanValue(key, false);
}

} // namespace scpull::core

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
#ifndef INCLUDED_CORE_INIFILE_H
#define INCLUDED_CORE_INIFILE_H

#include <filesystem>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace scpull::core {

/**
 * Read only view of an INI file.  Keys are looked up in each of the
 * sections given to the constructor, in order, so that a more specific
 * section may override a general one.
 *
 * Example:
 *   IniFile ini("scpull.ini", {"scpull"});
 *   const auto port = ini.value<int>("port", 22);
 */
class IniFile final {
public:
  IniFile(std::filesystem::path path, std::initializer_list<const std::string> sections);
  ~IniFile() = default;

  [[nodiscard]] bool IsOpen() const noexcept { return open_; }

  template <typename T>
  [[nodiscard]] T value(const std::string& key, const T& default_value) const {
    return static_cast<T>(GetNumericValueT(key, default_value));
  }

  template <typename T>
  [[nodiscard]] T value(const std::string& key) const {
    return static_cast<T>(GetNumericValueT(key, T()));
  }

  [[nodiscard]] std::filesystem::path path() const noexcept { return path_; }

  /** Returns true if key is present in any of the sections. */
  [[nodiscard]] bool contains(const std::string& key) const;

  IniFile(const IniFile& other) = delete;
  IniFile& operator=(const IniFile& other) = delete;

private:
  [[nodiscard]] std::optional<std::string> GetValue(const std::string& key) const;

  [[nodiscard]] std::string GetStringValue(const std::string& key,
                                           const std::string& default_value) const;
  [[nodiscard]] long GetNumericValueT(const std::string& key, long default_value = 0) const;
  [[nodiscard]] bool GetBooleanValue(const std::string& key, bool default_value = false) const;

  const std::filesystem::path path_;
  bool open_{false};
  std::vector<std::string> sections_;
  std::map<std::string, std::string> data_;
};

template <>
[[nodiscard]] std::string IniFile::value<std::string>(const std::string& key,
                                                      const std::string& default_value) const;

template <>
[[nodiscard]] std::string IniFile::value<std::string>(const std::string& key) const;

template <>
[[nodiscard]] bool IniFile::value<bool>(const std::string& key, const bool& default_value) const;
template <>
[[nodiscard]] bool IniFile::value<bool>(const std::string& key) const;

} // namespace scpull::core

#endif

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
#ifndef INCLUDED_CORE_STRINGS_H
#define INCLUDED_CORE_STRINGS_H

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace scpull::strings {

template <typename A> std::string StrCat(const A& a) noexcept {
  try {
    std::ostringstream ss;
    ss << a;
    return ss.str();
  } catch (...) {
    return {};
  }
}

template <typename A, typename... Args> std::string StrCat(const A& a, const Args&... args) noexcept {
  try {
    std::ostringstream ss;
    ss << a << StrCat(args...);
    return ss.str();
  } catch (...) {
    return {};
  }
}

// Comparisons
[[nodiscard]] bool iequals(const std::string& s1, const std::string& s2);

const std::string& StringReplace(std::string* orig, const std::string& old_string,
                                 const std::string& new_string);
std::vector<std::string> SplitString(const std::string& original_string,
                                     const std::string& delims);
[[nodiscard]] std::vector<std::string> SplitString(const std::string& original_string,
                                                   const std::string& delims, bool skip_empty);
void SplitString(const std::string& original_string, const std::string& delims, bool skip_empty,
                 std::vector<std::string>* out);

[[nodiscard]] bool starts_with(const std::string& input, const std::string& match);

void StringTrim(std::string* s);
[[nodiscard]] std::string StringTrim(const std::string& orig);
void StringTrimEnd(std::string* s);

/**
 * Joins the strings in lines, using separator in between each line.
 */
[[nodiscard]] std::string JoinStrings(const std::vector<std::string>& lines,
                                      const std::string& separator);

/** Returns true if every character of s is one of the digits valid in base b (8 or 10). */
[[nodiscard]] bool is_number(const std::string& s, int b = 10) noexcept;

template <typename T, typename std::enable_if<std::is_unsigned<T>::value, T>::type* = nullptr>
T to_number(const std::string& s, int b = 10) {
  char* end;
  errno = 0;
  auto result = strtoull(s.c_str(), &end, b);
  if (errno == ERANGE) {
    return 0;
  }
  if (result > std::numeric_limits<T>::max()) {
    return std::numeric_limits<T>::max();
  }
  return static_cast<T>(result);
}

template <typename T, typename std::enable_if<std::is_signed<T>::value, T>::type* = nullptr>
T to_number(const std::string& s, int b = 10) {
  char* end;
  errno = 0;
  auto result = strtoll(s.c_str(), &end, b);
  if (errno == ERANGE) {
    return 0;
  }
  if (result > std::numeric_limits<T>::max()) {
    return std::numeric_limits<T>::max();
  }
  if (result < std::numeric_limits<T>::min()) {
    return std::numeric_limits<T>::min();
  }
  return static_cast<T>(result);
}

/**
 * Return true if haystack contains needed as a substring.
 *
 * Like boost::contains.
 */
bool contains(const std::string& haystack, const std::string_view& needle) noexcept;

extern const char* DELIMS_WHITE;

} // namespace scpull::strings

#endif

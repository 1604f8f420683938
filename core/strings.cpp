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
#include "core/strings.h"

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace scpull::strings {

const char* DELIMS_WHITE = " \t\r\n";

bool iequals(const std::string& s1, const std::string& s2) {
  return s1.size() == s2.size() &&
         std::equal(s1.begin(), s1.end(), s2.begin(), [](const char& c1, const char& c2) {
           return std::tolower(c1) == std::tolower(c2);
         });
}

const std::string& StringReplace(std::string* orig, const std::string& old_string,
                                 const std::string& new_string) {
  auto pos = orig->find(old_string, 0);
  while (pos != std::string::npos) {
    orig->replace(pos, old_string.length(), new_string);
    pos = orig->find(old_string, pos + new_string.length());
  }
  return *orig;
}

std::vector<std::string> SplitString(const std::string& original_string,
                                     const std::string& delims) {
  return SplitString(original_string, delims, true);
}

std::vector<std::string> SplitString(const std::string& original_string,
                                     const std::string& delims, bool skip_empty) {
  std::vector<std::string> v;
  SplitString(original_string, delims, skip_empty, &v);
  return v;
}

void SplitString(const std::string& original_string, const std::string& delims, bool skip_empty,
                 std::vector<std::string>* out) {
  auto s(original_string);
  for (auto found = s.find_first_of(delims); found != std::string::npos;
       s = s.substr(found + 1), found = s.find_first_of(delims)) {
    if (found > 0) {
      out->push_back(s.substr(0, found));
    } else if (!skip_empty && found == 0) {
      // Add empty lines.
      out->push_back({});
    }
  }
  if (!s.empty()) {
    out->push_back(s);
  }
}

bool starts_with(const std::string& input, const std::string& match) {
  return input.size() >= match.size() &&
         std::equal(std::begin(match), std::end(match), std::begin(input));
}

/**
 * Removes spaces from the beginning and the end of the string s.
 *
 * @param s the string from which to remove spaces
 */
void StringTrim(std::string* s) {
  auto pos = s->find_first_not_of(DELIMS_WHITE);
  s->erase(0, pos);

  pos = s->find_last_not_of(DELIMS_WHITE);
  s->erase(pos + 1);
}

std::string StringTrim(const std::string& orig) {
  auto s(orig);
  StringTrim(&s);
  return s;
}

void StringTrimEnd(std::string* s) {
  const auto pos = s->find_last_not_of(DELIMS_WHITE);
  s->erase(pos + 1);
}

std::string JoinStrings(const std::vector<std::string>& lines, const std::string& separator) {
  std::string out;
  auto first = true;
  for (const auto& line : lines) {
    if (!first) {
      out += separator;
    }
    first = false;
    out += line;
  }
  return out;
}

bool is_number(const std::string& s, int b) noexcept {
  if (s.empty()) {
    return false;
  }
  const char max_digit = b == 8 ? '7' : '9';
  return std::all_of(s.begin(), s.end(), [max_digit](char c) { return c >= '0' && c <= max_digit; });
}

bool contains(const std::string& haystack, const std::string_view& needle) noexcept {
  return haystack.find(needle) != std::string::npos;
}

} // namespace scpull::strings

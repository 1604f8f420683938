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
#ifndef INCLUDED_SCP_CONTROL_LINE_H
#define INCLUDED_SCP_CONTROL_LINE_H

#include <chrono>
#include <cstdint>
#include <string>

namespace scpull::scp {

// Longest control line accepted from the sender, including the \n.
static constexpr int kMaxControlLineLength = 8192;

enum class ControlType { file, directory, end_directory, times, error };

/** Modification and access times from a T line. */
struct FileTimes {
  int64_t mtime{0};
  int mtime_usec{0};
  int64_t atime{0};
  int atime_usec{0};

  [[nodiscard]] std::chrono::system_clock::time_point modification_time() const;
  [[nodiscard]] std::chrono::system_clock::time_point access_time() const;
};

/**
 * One decoded control line.
 *
 * C and D lines fill mode, size and name.  T lines fill times.  Sender
 * error lines (0x01, 0x02) fill message and fatal.
 */
struct ControlLine {
  ControlType type{ControlType::end_directory};
  int mode{0};
  int64_t size{0};
  std::string name;
  FileTimes times;
  std::string message;
  bool fatal{false};
};

/**
 * Parses a control line with its trailing \n already removed.
 *
 * Throws protocol_error for malformed lines, timestamp_range_error when a
 * microsecond field is above 999999 and path_error for names that are
 * empty, "." or "..", or contain a '/'.  Sender error lines are returned
 * as ControlType::error, not thrown.
 */
ControlLine ParseControlLine(const std::string& line);

/** Renders a line for logging, escaping control characters. */
std::string DebugString(const std::string& line);

} // namespace scpull::scp

#endif

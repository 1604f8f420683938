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
#include "scp/control_line.h"

#include "core/strings.h"
#include "scp/scp_exceptions.h"
#include "fmt/format.h"
#include <chrono>
#include <limits>
#include <string>
#include <vector>

using namespace std::chrono;
using namespace scpull::strings;

namespace scpull::scp {

static constexpr int kMaxMode = 07777;
static constexpr int kMaxUsec = 999999;
// 9999-12-31T23:59:59Z
static constexpr int64_t kMaxSeconds = 253402300799;

static system_clock::time_point to_time_point(int64_t secs, int usec) {
  return system_clock::time_point(duration_cast<system_clock::duration>(seconds(secs) +
                                                                        microseconds(usec)));
}

system_clock::time_point FileTimes::modification_time() const {
  return to_time_point(mtime, mtime_usec);
}

system_clock::time_point FileTimes::access_time() const { return to_time_point(atime, atime_usec); }

static FileTimes ParseTimes(const std::string& line) {
  const auto parts = SplitString(line.substr(1), " ", false);
  if (parts.size() != 4) {
    throw protocol_error(StrCat("expected 4 fields in time line: ", DebugString(line)));
  }
  for (const auto& p : parts) {
    if (!is_number(p) || p.size() > 18) {
      throw protocol_error(StrCat("invalid number in time line: ", DebugString(line)));
    }
  }
  FileTimes t;
  t.mtime = to_number<int64_t>(parts[0]);
  const auto mtime_usec = to_number<int64_t>(parts[1]);
  t.atime = to_number<int64_t>(parts[2]);
  const auto atime_usec = to_number<int64_t>(parts[3]);
  if (mtime_usec > kMaxUsec || atime_usec > kMaxUsec || t.mtime > kMaxSeconds ||
      t.atime > kMaxSeconds) {
    throw timestamp_range_error(DebugString(line));
  }
  t.mtime_usec = static_cast<int>(mtime_usec);
  t.atime_usec = static_cast<int>(atime_usec);
  return t;
}

static void ValidateName(const std::string& name) {
  if (name.empty() || name == "." || name == ".." || name.find('/') != std::string::npos) {
    throw path_error(name);
  }
}

static ControlLine ParseEntry(const std::string& line) {
  // C<mode> <size> <name>, where name is everything after the second space.
  const auto sp1 = line.find(' ');
  if (sp1 == std::string::npos) {
    throw protocol_error(StrCat("missing size: ", DebugString(line)));
  }
  const auto sp2 = line.find(' ', sp1 + 1);
  if (sp2 == std::string::npos) {
    throw protocol_error(StrCat("missing name: ", DebugString(line)));
  }
  const auto mode_str = line.substr(1, sp1 - 1);
  const auto size_str = line.substr(sp1 + 1, sp2 - sp1 - 1);
  if (!is_number(mode_str, 8)) {
    throw protocol_error(StrCat("invalid mode: ", DebugString(line)));
  }
  // Longer fields could overflow the conversion below.
  if (mode_str.size() > 12 || size_str.size() > 18) {
    throw protocol_error(StrCat("field too long: ", DebugString(line)));
  }
  if (!is_number(size_str)) {
    throw protocol_error(StrCat("invalid size: ", DebugString(line)));
  }

  ControlLine c;
  c.type = line.front() == 'C' ? ControlType::file : ControlType::directory;
  c.mode = to_number<int>(mode_str, 8);
  if (c.mode > kMaxMode || c.mode < 0) {
    throw protocol_error(StrCat("mode out of range: ", DebugString(line)));
  }
  c.size = to_number<int64_t>(size_str);
  if (c.size < 0 || c.size >= std::numeric_limits<int64_t>::max()) {
    throw protocol_error(StrCat("size out of range: ", DebugString(line)));
  }
  c.name = line.substr(sp2 + 1);
  ValidateName(c.name);
  return c;
}

ControlLine ParseControlLine(const std::string& line) {
  if (line.empty()) {
    throw protocol_error("empty control line");
  }
  switch (line.front()) {
  case 'C':
  case 'D':
    return ParseEntry(line);
  case 'E': {
    if (line.size() != 1) {
      throw protocol_error(StrCat("unexpected data after E: ", DebugString(line)));
    }
    ControlLine c;
    c.type = ControlType::end_directory;
    return c;
  }
  case 'T': {
    ControlLine c;
    c.type = ControlType::times;
    c.times = ParseTimes(line);
    return c;
  }
  case '\x01':
  case '\x02': {
    ControlLine c;
    c.type = ControlType::error;
    c.fatal = line.front() == '\x02';
    c.message = line.substr(1);
    return c;
  }
  default:
    throw protocol_error(StrCat("unknown control line: ", DebugString(line)));
  }
}

std::string DebugString(const std::string& line) {
  std::string out;
  out.reserve(line.size());
  for (const auto ch : line) {
    const auto uc = static_cast<unsigned char>(ch);
    if (uc < 0x20 || uc == 0x7f) {
      out += fmt::format("\\x{:02x}", uc);
    } else {
      out.push_back(ch);
    }
  }
  return out;
}

} // namespace scpull::scp

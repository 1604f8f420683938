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
#include "core/datetime.h"

#include "core/strings.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

using namespace std::chrono;
using namespace scpull::strings;

namespace scpull::core {

std::string to_string(duration<double> dd) {
  auto ns = duration_cast<nanoseconds>(dd);
  typedef duration<int, std::ratio<86400>> days;
  std::ostringstream os;
  const auto d = duration_cast<days>(ns);
  ns -= d;
  const auto h = duration_cast<hours>(ns);
  ns -= h;
  const auto m = duration_cast<minutes>(ns);
  ns -= m;
  const auto s = duration_cast<seconds>(ns);
  ns -= s;
  const auto ms = duration_cast<milliseconds>(ns);
  auto has_one = false;
  const auto append = [&](long long count, const char* unit) {
    if (count <= 0) {
      return;
    }
    if (has_one) {
      os << " ";
    }
    has_one = true;
    os << count << unit;
  };
  append(d.count(), "d");
  append(h.count(), "h");
  append(m.count(), "m");
  append(s.count(), "s");
  append(ms.count(), "ms");
  if (!has_one) {
    return "0ms";
  }
  return os.str();
}

DateTime::DateTime(system_clock::time_point t)
  : t_(system_clock::to_time_t(t)),
    millis_(static_cast<int>(duration_cast<milliseconds>(t.time_since_epoch()).count() % 1000)) {
  update_tm();
}

DateTime::DateTime(time_t t) : t_(t), millis_(0) { update_tm(); }

std::string DateTime::to_string(const std::string& format) const {
  std::ostringstream ss;
  ss << std::put_time(&tm_, format.c_str());
  return ss.str();
}

std::string DateTime::to_string() const {
  char buf[32];
  if (!asctime_r(&tm_, buf)) {
    return {};
  }
  auto s = std::string(buf);
  StringTrimEnd(&s);
  return s;
}

DateTime DateTime::now() { return DateTime(system_clock::now()); }

void DateTime::update_tm() noexcept {
  if (t_ < 0) {
    t_ = 0;
  }
  localtime_r(&t_, &tm_);
}

} // namespace scpull::core

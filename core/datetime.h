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
#ifndef INCLUDED_CORE_DATETIME_H
#define INCLUDED_CORE_DATETIME_H

#include <chrono>
#include <ctime>
#include <string>

namespace scpull::core {

/** Displays dd as a human readable time */
std::string to_string(std::chrono::duration<double> dd);

class DateTime {
public:
  static DateTime from_time_t(time_t t) {
    return DateTime(t);
  }

  static DateTime now();

  int hour() const noexcept { return tm_.tm_hour; }
  int minute() const noexcept { return tm_.tm_min; }
  int second() const noexcept { return tm_.tm_sec; }

  /** Month starting at 1 for this DateTime */
  int month() const noexcept { return tm_.tm_mon + 1; }
  /** Day starting at 1 for this DateTime */
  int day() const noexcept { return tm_.tm_mday; }
  /** Year starting at 0 for this DateTime */
  int year() const noexcept { return tm_.tm_year + 1900; }

  /** Prints a date using the strftime format specified.  */
  std::string to_string(const std::string& format) const;

  /** Prints a Date using asctime but without the trailing linefeed. */
  std::string to_string() const;

  /** Returns this Datetime as a UNIX time_t */
  time_t to_time_t() const noexcept { return t_; }

  /** Milliseconds past to_time_t() */
  int millis() const noexcept { return millis_; }

private:
  explicit DateTime(std::chrono::system_clock::time_point t);
  explicit DateTime(time_t t);
  /** Updates the tm_ structure, should be called anytime the time_t value is changed */
  void update_tm() noexcept;

  time_t t_;
  tm tm_{};
  int millis_;
};

} // namespace scpull::core

#endif

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
#include "gtest/gtest.h"
#include <chrono>
#include <cstdlib>
#include <ctime>

using namespace std::chrono;
using namespace scpull::core;

TEST(DateTime, Now) {
  const auto start = DateTime::now();
  const auto start_t = time(nullptr);
  EXPECT_LE(std::abs(start.to_time_t() - start_t), 1);
}

TEST(DateTime, FromTimeT) {
  const auto dt = DateTime::from_time_t(1700000000);
  EXPECT_EQ(1700000000, dt.to_time_t());
  EXPECT_EQ(2023, dt.year());
}

TEST(DateTime, ToString_Duration) {
  EXPECT_EQ("0ms", to_string(duration<double>(0)));
  EXPECT_EQ("1m 2s", to_string(seconds(62)));
  EXPECT_EQ("1h 1s 500ms", to_string(hours(1) + seconds(1) + milliseconds(500)));
}

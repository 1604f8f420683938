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
#include "gtest/gtest.h"

#include "core/os.h"
#include <chrono>
#include <string>

using std::string;
using namespace std::chrono;
using namespace scpull::os;

TEST(OsTest, WaitFor_PredicateTrue) {
  auto predicate = []() { return true; };
  const auto start = steady_clock::now();
  const auto d = seconds(1);
  const auto is_predicate_true = wait_for(predicate, d);
  ASSERT_TRUE(steady_clock::now() < start + d);
  EXPECT_TRUE(is_predicate_true);
}

TEST(OsTest, WaitFor_PredicateFalse) {
  auto predicate = []() { return false; };
  const auto start = steady_clock::now();
  const auto d = milliseconds(100);
  const auto is_predicate_true = wait_for(predicate, d);
  ASSERT_TRUE(steady_clock::now() >= start + d);
  EXPECT_FALSE(is_predicate_true);
}

TEST(OsTest, WaitFor_BecomesTrue) {
  auto count = 0;
  auto predicate = [&count]() { return ++count > 3; };
  EXPECT_TRUE(wait_for(predicate, seconds(5)));
  EXPECT_EQ(4, count);
}

TEST(OsTest, EnvironmentVariable_DoesNotExist) {
  EXPECT_EQ("", environment_variable("SCPULL_OSTEST_DOES_NOT_EXIST"));
}

TEST(OsTest, SetEnvironmentVariable) {
  const string name = "SCPULL_OSTEST_SET";
  ASSERT_EQ("", environment_variable(name));
  ASSERT_TRUE(set_environment_variable(name, "ASDF"));
  ASSERT_EQ("ASDF", environment_variable(name));
}

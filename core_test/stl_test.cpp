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
#include "core/stl.h"
#include <map>
#include <string>
#include <vector>

using std::map;
using std::string;
using std::vector;

using namespace scpull::stl;

TEST(StlTest, Contains_VectorInts) {
  const vector<int> ints = { 1, 2, 3 };

  EXPECT_TRUE(contains(ints, 1));
  EXPECT_FALSE(contains(ints, 0));
  EXPECT_FALSE(contains(ints, 4));
}

TEST(StlTest, Contains_VectorStrings) {
  const vector<string> strings = { "one", "two", "three" };

  EXPECT_TRUE(contains(strings, "one"));
  EXPECT_FALSE(contains(strings, ""));
}

TEST(StlTest, Contains_MapStringStrings) {
  const map<string, string> strings = { { "one", "1" }, { "two", "2" } };

  EXPECT_TRUE(contains(strings, "one"));
  EXPECT_FALSE(contains(strings, "zero"));
}

TEST(StlTest, Contains_MapConstStringStrings) {
  const map<const string, string> strings = {{"port", "22"}, {"ssh", "ssh"}};

  EXPECT_TRUE(contains(strings, "port"));
  EXPECT_FALSE(contains(strings, "scp"));
}

TEST(StlTest, SSize) {
  const string chunk("abc\0", 4);
  const auto n = ssize(chunk);
  static_assert(std::is_signed<decltype(n)>::value, "ssize must be signed");
  EXPECT_EQ(4, n);
}

TEST(StlTest, SizeInt) {
  const vector<string> dirs = {"a", "b"};
  EXPECT_EQ(2, size_int(dirs));
  EXPECT_EQ(0, size_int(vector<int>{}));
}

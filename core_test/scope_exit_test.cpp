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
#include "core/scope_exit.h"
#include "gtest/gtest.h"
#include <stdexcept>
#include <utility>

using scpull::core::finally;
using scpull::core::ScopeExit;

TEST(ScopeExitTest, Basic) {
  auto committed = false;
  auto f = [&] { committed = true; };
  {
    ScopeExit e(f);
    ASSERT_FALSE(committed);
  }
  ASSERT_TRUE(committed);
}

TEST(ScopeExitTest, Release) {
  auto called = false;
  {
    auto e = finally([&] { called = true; });
    e.release();
  }
  EXPECT_FALSE(called);
}

TEST(ScopeExitTest, Move) {
  auto count = 0;
  {
    auto e = finally([&] { ++count; });
    {
      auto moved = std::move(e);
      EXPECT_EQ(0, count);
    }
    EXPECT_EQ(1, count);
  }
  EXPECT_EQ(1, count);
}

TEST(ScopeExitTest, Exception) {
  auto cleaned_up = false;
  try {
    auto e = finally([&] { cleaned_up = true; });
    throw std::runtime_error("boom");
  } catch (const std::runtime_error&) {
    EXPECT_TRUE(cleaned_up);
  }
  EXPECT_TRUE(cleaned_up);
}

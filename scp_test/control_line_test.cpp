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
#include "scp/scp_exceptions.h"
#include "gtest/gtest.h"
#include <chrono>
#include <string>

using namespace scpull::scp;

TEST(ControlLineTest, File) {
  const auto c = ParseControlLine("C0644 1234 file.txt");
  EXPECT_EQ(c.type, ControlType::file);
  EXPECT_EQ(c.mode, 0644);
  EXPECT_EQ(c.size, 1234);
  EXPECT_EQ(c.name, "file.txt");
}

TEST(ControlLineTest, File_NameWithSpaces) {
  const auto c = ParseControlLine("C0600 0 my file .txt ");
  EXPECT_EQ(c.name, "my file .txt ");
  EXPECT_EQ(c.size, 0);
}

TEST(ControlLineTest, File_LargeSize) {
  const auto c = ParseControlLine("C0644 10737418240 big.iso");
  EXPECT_EQ(c.size, 10737418240LL);
}

TEST(ControlLineTest, Directory) {
  const auto c = ParseControlLine("D0755 0 logs");
  EXPECT_EQ(c.type, ControlType::directory);
  EXPECT_EQ(c.mode, 0755);
  EXPECT_EQ(c.name, "logs");
}

TEST(ControlLineTest, EndDirectory) {
  EXPECT_EQ(ParseControlLine("E").type, ControlType::end_directory);
  EXPECT_THROW(ParseControlLine("E "), protocol_error);
  EXPECT_THROW(ParseControlLine("Ex"), protocol_error);
}

TEST(ControlLineTest, Times) {
  const auto c = ParseControlLine("T1234567890 123 1234567800 999999");
  EXPECT_EQ(c.type, ControlType::times);
  EXPECT_EQ(c.times.mtime, 1234567890);
  EXPECT_EQ(c.times.mtime_usec, 123);
  EXPECT_EQ(c.times.atime, 1234567800);
  EXPECT_EQ(c.times.atime_usec, 999999);

  using namespace std::chrono;
  EXPECT_EQ(duration_cast<microseconds>(c.times.modification_time().time_since_epoch()).count(),
            1234567890000123LL);
}

TEST(ControlLineTest, Times_Malformed) {
  EXPECT_THROW(ParseControlLine("T1 2 3"), protocol_error);
  EXPECT_THROW(ParseControlLine("T1 2 3 4 5"), protocol_error);
  EXPECT_THROW(ParseControlLine("T1 x 3 4"), protocol_error);
  EXPECT_THROW(ParseControlLine("T-1 0 3 4"), protocol_error);
}

TEST(ControlLineTest, Times_OutOfRange) {
  EXPECT_THROW(ParseControlLine("T1 1000000 3 0"), timestamp_range_error);
  EXPECT_THROW(ParseControlLine("T1 0 3 1000000"), timestamp_range_error);
  EXPECT_THROW(ParseControlLine("T999999999999 0 3 0"), timestamp_range_error);
}

TEST(ControlLineTest, Error) {
  const auto warn = ParseControlLine("\x01scp: /nope: No such file or directory");
  EXPECT_EQ(warn.type, ControlType::error);
  EXPECT_FALSE(warn.fatal);
  EXPECT_EQ(warn.message, "scp: /nope: No such file or directory");

  const auto fatal = ParseControlLine("\x02" "fatal");
  EXPECT_EQ(fatal.type, ControlType::error);
  EXPECT_TRUE(fatal.fatal);
  EXPECT_EQ(fatal.message, "fatal");
}

TEST(ControlLineTest, BadMode) {
  EXPECT_THROW(ParseControlLine("C0899 1 a"), protocol_error);
  EXPECT_THROW(ParseControlLine("C17777 1 a"), protocol_error);
  EXPECT_THROW(ParseControlLine("C 1 a"), protocol_error);
  EXPECT_THROW(ParseControlLine("Crwx 1 a"), protocol_error);
}

TEST(ControlLineTest, BadSize) {
  EXPECT_THROW(ParseControlLine("C0644 -1 a"), protocol_error);
  EXPECT_THROW(ParseControlLine("C0644 1k a"), protocol_error);
  EXPECT_THROW(ParseControlLine("C0644  a"), protocol_error);
  EXPECT_THROW(ParseControlLine("C0644 99999999999999999999 a"), protocol_error);
}

TEST(ControlLineTest, MissingFields) {
  EXPECT_THROW(ParseControlLine("C0644"), protocol_error);
  EXPECT_THROW(ParseControlLine("C0644 12"), protocol_error);
}

TEST(ControlLineTest, BadName) {
  EXPECT_THROW(ParseControlLine("C0644 1 "), path_error);
  EXPECT_THROW(ParseControlLine("C0644 1 ."), path_error);
  EXPECT_THROW(ParseControlLine("C0644 1 .."), path_error);
  EXPECT_THROW(ParseControlLine("C0644 1 ../evil"), path_error);
  EXPECT_THROW(ParseControlLine("D0755 0 a/b"), path_error);
  EXPECT_THROW(ParseControlLine("D0755 0 /etc"), path_error);
}

TEST(ControlLineTest, Unknown) {
  EXPECT_THROW(ParseControlLine(""), protocol_error);
  EXPECT_THROW(ParseControlLine("X"), protocol_error);
  EXPECT_THROW(ParseControlLine("c0644 1 a"), protocol_error);
}

TEST(ControlLineTest, DebugString) {
  EXPECT_EQ(DebugString("C0644 1 a"), "C0644 1 a");
  EXPECT_EQ(DebugString("\x01oops\n"), "\\x01oops\\x0a");
  EXPECT_EQ(DebugString(std::string("a\0b", 3)), "a\\x00b");
}

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
#include "core/channel_exceptions.h"
#include "core/process_connection.h"
#include "gtest/gtest.h"
#include <chrono>
#include <string>

using namespace std::chrono;
using namespace scpull::core;

static constexpr auto kTimeout = seconds(10);

static std::unique_ptr<ProcessConnection> Shell(const std::string& script) {
  return ProcessConnection::Spawn({"/bin/sh", "-c", script},
                                  ProcessConnection::StderrMode::discard);
}

TEST(ProcessConnectionTest, ReadLine) {
  auto c = Shell("printf 'one\\ntwo\\nthree'");
  EXPECT_EQ("one\n", c->read_line(100, kTimeout));
  EXPECT_EQ("two\n", c->read_line(100, kTimeout));
  // Partial line at end of stream.
  EXPECT_EQ("three", c->read_line(100, kTimeout));
  EXPECT_EQ("", c->read_line(100, kTimeout));
  EXPECT_TRUE(c->close());
  EXPECT_EQ(0, c->exit_code().value_or(-1));
}

TEST(ProcessConnectionTest, ReadLine_MaxSize) {
  auto c = Shell("printf 'abcdefgh\\n'");
  EXPECT_EQ("abcd", c->read_line(4, kTimeout));
  EXPECT_EQ("efgh\n", c->read_line(100, kTimeout));
}

TEST(ProcessConnectionTest, ReceiveUpto) {
  auto c = Shell("printf 'hello world'");
  std::string all;
  for (;;) {
    const auto s = c->receive_upto(4, kTimeout);
    if (s.empty()) {
      break;
    }
    EXPECT_LE(s.size(), 4u);
    all += s;
  }
  EXPECT_EQ("hello world", all);
}

TEST(ProcessConnectionTest, MixedReads) {
  auto c = Shell("printf 'C0644 5 a.txt\\nhello\\000E\\n'");
  EXPECT_EQ("C0644 5 a.txt\n", c->read_line(8192, kTimeout));
  std::string data;
  while (data.size() < 6) {
    data += c->receive_upto(static_cast<int>(6 - data.size()), kTimeout);
  }
  EXPECT_EQ(std::string("hello\0", 6), data);
  EXPECT_EQ("E\n", c->read_line(8192, kTimeout));
}

TEST(ProcessConnectionTest, Send) {
  auto c = ProcessConnection::Spawn({"cat"}, ProcessConnection::StderrMode::discard);
  EXPECT_EQ(4, c->send("ping", kTimeout));
  EXPECT_EQ(1, c->send(std::string(1, '\0'), kTimeout));
  EXPECT_EQ("ping", c->receive_upto(4, kTimeout));
  EXPECT_EQ(std::string(1, '\0'), c->receive_upto(10, kTimeout));
  EXPECT_TRUE(c->close());
  EXPECT_EQ(0, c->exit_code().value_or(-1));
  EXPECT_FALSE(c->is_open());
}

TEST(ProcessConnectionTest, ExitCode) {
  auto c = Shell("exit 3");
  EXPECT_EQ("", c->receive_upto(10, kTimeout));
  EXPECT_FALSE(c->exit_code().has_value());
  c->close();
  EXPECT_EQ(3, c->exit_code().value_or(-1));
}

TEST(ProcessConnectionTest, ProgramNotFound) {
  auto c = ProcessConnection::Spawn({"/nonexistent/scpull/program"},
                                    ProcessConnection::StderrMode::discard);
  EXPECT_EQ("", c->read_line(10, kTimeout));
  c->close();
  EXPECT_EQ(127, c->exit_code().value_or(-1));
}

TEST(ProcessConnectionTest, EmptyArgv) {
  EXPECT_THROW(ProcessConnection::Spawn({}, ProcessConnection::StderrMode::discard),
               spawn_error);
}

TEST(ProcessConnectionTest, Timeout) {
  auto c = Shell("sleep 1");
  EXPECT_THROW(c->read_line(10, milliseconds(100)), timeout_error);
  c->close();
}

TEST(ProcessConnectionTest, Send_AfterExit) {
  auto c = Shell("exit 0");
  EXPECT_EQ("", c->receive_upto(10, kTimeout));
  // Give the child time to go away so its stdin is closed.
  c->read_line(10, kTimeout);
  std::string big(1024 * 1024, 'x');
  EXPECT_THROW(c->send(big, kTimeout), channel_closed_error);
}

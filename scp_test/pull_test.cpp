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
#include "scp/pull.h"

#include "core/channel_exceptions.h"
#include "core/strings.h"
#include "core_test/file_helper.h"
#include "scp/scp_exceptions.h"
#include "scp_test/fake_sender.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include <filesystem>
#include <string>
#include <vector>

using namespace scpull::core;
using namespace scpull::scp;
using namespace scpull::strings;
using testing::ElementsAre;

class PullTest : public testing::Test {
protected:
  PullTest() : exec_(sender_) {
    helper_.Mkdir("in");
    root_ = helper_.Dir("in");
  }

  PullOptions Options(const std::string& remote, bool recursive) const {
    PullOptions o;
    o.remote_path = remote;
    o.destination = root_;
    o.recursive = recursive;
    return o;
  }

  FileHelper helper_;
  FakeSender sender_;
  FakeRemoteExec exec_;
  std::filesystem::path root_;
};

TEST_F(PullTest, Recursive) {
  sender_.AddSegment("D0755 0 logs\n");
  sender_.AddFile("C0644 5 a.log\n", "hello");
  sender_.AddSegment("E\n");

  Pull pull(exec_, Options("/var/logs", true));
  pull.Start();

  EXPECT_THAT(exec_.commands(), ElementsAre("scp -v -f -p -r '/var/logs'"));
  EXPECT_EQ(helper_.ReadFile(root_ / "logs" / "a.log"), "hello");
  // Handshake, D, C, data and E.
  EXPECT_EQ(sender_.acks(), 5);
  EXPECT_EQ(sender_.sent(), std::string(5, '\0'));
  EXPECT_TRUE(sender_.all_sent());
  EXPECT_EQ(sender_.close_count(), 1);
  EXPECT_EQ(pull.stats().files, 1);
  EXPECT_EQ(pull.stats().directories, 1);
  EXPECT_EQ(pull.stats().bytes, 5);
}

TEST_F(PullTest, SingleFile) {
  sender_.AddSegment("T1234567890 0 1234567890 0\n");
  sender_.AddFile("C0640 3 notes.txt\n", "abc");

  auto o = Options("notes.txt", false);
  o.destination = root_ / "copy.txt";
  o.scp_program = "/opt/bin/scp";
  Pull pull(exec_, o);
  pull.Start();

  EXPECT_THAT(exec_.commands(), ElementsAre("/opt/bin/scp -v -f -p 'notes.txt'"));
  EXPECT_EQ(helper_.ReadFile(root_ / "copy.txt"), "abc");
  EXPECT_EQ(sender_.acks(), 4);
}

TEST_F(PullTest, SmallReads) {
  const std::string payload(1000, 'x');
  sender_.AddFile("C0644 1000 big\n", payload);
  sender_.AddFile("C0644 0 empty\n", "");
  sender_.set_max_chunk(7);

  int progress_count = 0;
  ScpEvents events;
  events.progress = [&](const std::string&, int64_t, int64_t) { ++progress_count; };

  Pull pull(exec_, Options("dir", true));
  pull.add_observer(events);
  pull.Start();

  EXPECT_EQ(helper_.ReadFile(root_ / "big"), payload);
  EXPECT_EQ(helper_.ReadFile(root_ / "empty"), "");
  EXPECT_EQ(pull.stats().files, 2);
  EXPECT_EQ(pull.stats().bytes, 1000);
  // One per 7 byte read of big, plus the start and end of each file.
  EXPECT_EQ(progress_count, 146);
}

TEST_F(PullTest, Observers) {
  sender_.AddSegment("D0755 0 d\n");
  sender_.AddFile("C0644 2 f\n", "hi");
  sender_.AddSegment("E\n");

  std::vector<std::string> first;
  std::vector<std::string> second;
  ScpEvents a;
  a.mkdir = [&](const std::string& p) { first.push_back(StrCat("mkdir ", p)); };
  a.download = [&](const std::string& p, int64_t n) {
    first.push_back(StrCat("download ", p, " ", n));
  };
  a.done = [&](const std::string& p) { first.push_back(StrCat("done ", p)); };
  ScpEvents b;
  b.done = [&](const std::string& p) { second.push_back(StrCat("done ", p)); };

  Pull pull(exec_, Options("d", true));
  pull.add_observer(a);
  pull.add_observer(b);
  pull.Start();

  EXPECT_THAT(first, ElementsAre("mkdir d", "download d/f 2", "done d/f"));
  EXPECT_THAT(second, ElementsAre("done d/f"));
}

TEST_F(PullTest, RemoteError) {
  sender_.AddSegment("\x01scp: /nope: No such file or directory\n");

  Pull pull(exec_, Options("/nope", true));
  EXPECT_THROW(pull.Start(), remote_error);
  EXPECT_EQ(sender_.close_count(), 1);
  EXPECT_EQ(pull.stats().files, 0);
}

TEST_F(PullTest, ErrorAfterSomeFiles) {
  sender_.AddFile("C0644 1 a\n", "a");
  sender_.AddSegment("\x01scp: b: Permission denied\n");

  Pull pull(exec_, Options("dir", true));
  EXPECT_THROW(pull.Start(), remote_error);
  EXPECT_EQ(pull.stats().files, 1);
  EXPECT_EQ(helper_.ReadFile(root_ / "a"), "a");
}

TEST_F(PullTest, Traversal) {
  sender_.AddFile("C0644 4 ../evil\n", "evil");

  Pull pull(exec_, Options("dir", true));
  EXPECT_THROW(pull.Start(), path_error);
  EXPECT_FALSE(std::filesystem::exists(helper_.Dir("evil")));
  // Only the handshake was acknowledged.
  EXPECT_EQ(sender_.acks(), 1);
  EXPECT_EQ(sender_.close_count(), 1);
}

TEST_F(PullTest, TruncatedData) {
  sender_.AddSegment("C0644 10 a\n");
  sender_.AddSegment("hello");

  Pull pull(exec_, Options("a", true));
  EXPECT_THROW(pull.Start(), channel_closed_error);
  EXPECT_EQ(sender_.close_count(), 1);
}

TEST_F(PullTest, NothingSent) {
  Pull pull(exec_, Options("dir", true));
  pull.Start();
  EXPECT_EQ(sender_.acks(), 1);
  EXPECT_EQ(pull.stats().files, 0);
}

TEST_F(PullTest, NonZeroExitCodeIsNotAnError) {
  sender_.AddFile("C0644 1 a\n", "a");
  sender_.set_exit_code(1);

  Pull pull(exec_, Options("a", true));
  pull.Start();
  EXPECT_EQ(helper_.ReadFile(root_ / "a"), "a");
}

TEST_F(PullTest, ExecFails) {
  exec_.set_fail_with("no such program");
  Pull pull(exec_, Options("a", true));
  EXPECT_THROW(pull.Start(), spawn_error);
}

TEST_F(PullTest, StartTwice) {
  Pull pull(exec_, Options("dir", true));
  pull.Start();
  EXPECT_THROW(pull.Start(), scp_error);
  EXPECT_EQ(exec_.commands().size(), 1u);
}

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
#include "scp/ssh_remote_exec.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include <string>
#include <vector>

using namespace scpull::scp;
using testing::ElementsAre;

TEST(SshRemoteExecTest, CommandLineFor_Defaults) {
  SshOptions o;
  o.destination = "bob@example.com";
  SshRemoteExec ssh(o);
  EXPECT_THAT(ssh.CommandLineFor("scp -v -f -p 'x'"),
              ElementsAre("ssh", "--", "bob@example.com", "scp -v -f -p 'x'"));
}

TEST(SshRemoteExecTest, CommandLineFor_AllOptions) {
  SshOptions o;
  o.program = "/usr/bin/ssh";
  o.destination = "example.com";
  o.port = 2222;
  o.identity_file = "/home/bob/.ssh/id_ed25519";
  o.options = {"BatchMode=yes", "StrictHostKeyChecking=no"};
  SshRemoteExec ssh(o);
  EXPECT_THAT(ssh.CommandLineFor("cmd"),
              ElementsAre("/usr/bin/ssh", "-p", "2222", "-i", "/home/bob/.ssh/id_ed25519", "-o",
                          "BatchMode=yes", "-o", "StrictHostKeyChecking=no", "--", "example.com",
                          "cmd"));
}

TEST(SshRemoteExecTest, CommandLineFor_DestinationIsNotAnOption) {
  SshOptions o;
  o.destination = "-oProxyCommand=touch /tmp/x";
  SshRemoteExec ssh(o);
  const auto argv = ssh.CommandLineFor("cmd");
  ASSERT_EQ(4u, argv.size());
  EXPECT_EQ("--", argv.at(1));
  EXPECT_EQ("-oProxyCommand=touch /tmp/x", argv.at(2));
}

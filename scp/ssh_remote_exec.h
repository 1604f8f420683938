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
#ifndef INCLUDED_SCP_SSH_REMOTE_EXEC_H
#define INCLUDED_SCP_SSH_REMOTE_EXEC_H

#include "scp/remote_exec.h"
#include <memory>
#include <string>
#include <vector>

namespace scpull::scp {

struct SshOptions {
  // The local ssh client.
  std::string program{"ssh"};
  // [user@]host
  std::string destination;
  // 0 uses the client's default.
  int port{0};
  std::string identity_file;
  // Each one is passed as -o <option>.
  std::vector<std::string> options;
  // Shows the remote command's stderr on ours.
  bool show_stderr{false};
};

/** RemoteExec using the local ssh client in a child process. */
class SshRemoteExec final : public RemoteExec {
public:
  explicit SshRemoteExec(SshOptions options);
  ~SshRemoteExec() override = default;

  std::unique_ptr<core::Connection> Exec(const std::string& command) override;

  /** The argument vector used to run command. */
  [[nodiscard]] std::vector<std::string> CommandLineFor(const std::string& command) const;

private:
  const SshOptions options_;
};

} // namespace scpull::scp

#endif

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

#include "core/log.h"
#include "core/process_connection.h"
#include "core/strings.h"
#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace scpull::core;
using namespace scpull::strings;

namespace scpull::scp {

SshRemoteExec::SshRemoteExec(SshOptions options)
  : options_(std::move(options)) {
}

std::vector<std::string> SshRemoteExec::CommandLineFor(const std::string& command) const {
  std::vector<std::string> argv{options_.program};
  if (options_.port > 0) {
    argv.emplace_back("-p");
    argv.emplace_back(std::to_string(options_.port));
  }
  if (!options_.identity_file.empty()) {
    argv.emplace_back("-i");
    argv.emplace_back(options_.identity_file);
  }
  for (const auto& o : options_.options) {
    argv.emplace_back("-o");
    argv.emplace_back(o);
  }
  argv.emplace_back("--");
  argv.emplace_back(options_.destination);
  argv.emplace_back(command);
  return argv;
}

std::unique_ptr<Connection> SshRemoteExec::Exec(const std::string& command) {
  const auto argv = CommandLineFor(command);
  VLOG(1) << "SshRemoteExec: " << JoinStrings(argv, " ");
  return ProcessConnection::Spawn(argv, options_.show_stderr
                                            ? ProcessConnection::StderrMode::inherit
                                            : ProcessConnection::StderrMode::discard);
}

} // namespace scpull::scp

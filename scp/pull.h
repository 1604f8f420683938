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
#ifndef INCLUDED_SCP_PULL_H
#define INCLUDED_SCP_PULL_H

#include "scp/receiver.h"
#include "scp/remote_exec.h"
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace scpull::scp {

struct PullOptions {
  // Path on the remote host, passed to the sender unchanged.
  std::string remote_path;
  // Local root.  With recursive unset this is the file to write.
  std::filesystem::path destination;
  bool recursive{false};
  // Program started on the remote host.
  std::string scp_program{"scp"};
  // Longest time to wait for the sender to say anything.
  std::chrono::duration<double> timeout{std::chrono::seconds(60)};
};

/**
 * Copies remote_path from the remote host to destination.
 *
 * Example:
 *   SshRemoteExec ssh(ssh_options);
 *   Pull pull(ssh, {"/var/log", "/tmp/logs", true});
 *   pull.add_observer(events);
 *   pull.Start();
 */
class Pull {
public:
  Pull(RemoteExec& exec, PullOptions options);
  ~Pull() = default;
  Pull(const Pull&) = delete;
  Pull& operator=(const Pull&) = delete;

  /** Every event of the transfer is passed to each observer, in the order added. */
  void add_observer(ScpEvents events);

  /**
   * Runs the transfer to completion.  Throws the first error seen, from the
   * channel or the receiver.  May only be called once.
   */
  void Start();

  [[nodiscard]] const TransferStats& stats() const noexcept { return stats_; }
  [[nodiscard]] const PullOptions& options() const noexcept { return options_; }

private:
  ScpEvents RelayEvents() const;

  RemoteExec& exec_;
  const PullOptions options_;
  std::vector<ScpEvents> observers_;
  TransferStats stats_;
  bool started_{false};
};

} // namespace scpull::scp

#endif

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
#ifndef INCLUDED_CORE_PROCESS_CONNECTION_H
#define INCLUDED_CORE_PROCESS_CONNECTION_H

#include "core/connection.h"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace scpull::core {

/**
 * Connection to the stdin and stdout of a child process.
 *
 * Example:
 *   auto c = ProcessConnection::Spawn({"ssh", "host", "uptime"},
 *                                     ProcessConnection::StderrMode::discard);
 *   const auto line = c->read_line(1024, std::chrono::seconds(10));
 *   c->close();
 *   LOG(INFO) << "exit code: " << c->exit_code().value_or(-1);
 */
class ProcessConnection final : public Connection {
public:
  enum class StderrMode { inherit, discard };

  /**
   * Starts argv[0] (looked up in PATH) with the arguments in argv.
   * Throws spawn_error if the process could not be created.
   */
  static std::unique_ptr<ProcessConnection> Spawn(const std::vector<std::string>& argv,
                                                  StderrMode stderr_mode);

  ProcessConnection(const ProcessConnection&) = delete;
  ProcessConnection& operator=(const ProcessConnection&) = delete;
  ~ProcessConnection() override;

  std::string receive_upto(int size, std::chrono::duration<double> d) override;
  std::string read_line(int max_size, std::chrono::duration<double> d) override;
  int send(const void* data, int size, std::chrono::duration<double> d) override;
  int send(const std::string& s, std::chrono::duration<double> d) override;

  [[nodiscard]] bool is_open() const override { return open_; }

  /**
   * Closes both pipes and reaps the child. A child that does not exit on
   * its own within a few seconds is sent SIGTERM.
   */
  bool close() override;

  /**
   * The exit code of the child once close() has reaped it.  A child killed
   * by a signal reports 128 + the signal number.
   */
  [[nodiscard]] std::optional<int> exit_code() const noexcept override { return exit_code_; }
  [[nodiscard]] pid_t pid() const noexcept { return pid_; }

private:
  ProcessConnection(pid_t pid, int read_fd, int write_fd);

  // Reads whatever is available into buffer_.  Returns false on end of stream.
  bool fill(std::chrono::steady_clock::time_point deadline);
  void reap(bool block);

  pid_t pid_;
  int read_fd_;
  int write_fd_;
  bool open_{true};
  bool eof_{false};
  std::string buffer_;
  std::optional<int> exit_code_;
};

} // namespace scpull::core

#endif

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
#ifndef INCLUDED_SCP_TEST_FAKE_SENDER_H
#define INCLUDED_SCP_TEST_FAKE_SENDER_H

#include "core/connection.h"
#include "scp/remote_exec.h"
#include <chrono>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

/**
 * Scripted remote sender.  Like a real one it sends nothing until it sees
 * an ack: each segment added becomes readable only after one more 0 byte
 * arrived from the receiver.  Reading while the next segment is still
 * held back throws timeout_error, since a real sender would be stuck too.
 */
class FakeSender {
public:
  FakeSender() = default;

  /** Adds data that is released by the next ack. */
  void AddSegment(const std::string& data);
  /** Convenience for a file: its C line, then the payload and status byte. */
  void AddFile(const std::string& line, const std::string& payload);

  // Connection side.
  std::string receive_upto(int size);
  std::string read_line(int max_size);
  void Received(const std::string& data);

  /** Largest chunk receive_upto returns. */
  void set_max_chunk(int max_chunk) { max_chunk_ = max_chunk; }
  void set_exit_code(std::optional<int> exit_code) { exit_code_ = exit_code; }
  [[nodiscard]] std::optional<int> exit_code() const { return exit_code_; }

  [[nodiscard]] int acks() const { return acks_; }
  [[nodiscard]] const std::string& sent() const { return sent_; }
  [[nodiscard]] bool all_sent() const { return inbound_.empty() && held_.empty(); }
  [[nodiscard]] int close_count() const { return close_count_; }
  void closed() { ++close_count_; }

private:
  std::string inbound_;
  std::deque<std::string> held_;
  std::string sent_;
  int acks_{0};
  int max_chunk_{64 * 1024};
  int close_count_{0};
  std::optional<int> exit_code_{0};
};

class FakeConnection : public scpull::core::Connection {
public:
  explicit FakeConnection(FakeSender& sender) : sender_(sender) {}
  ~FakeConnection() override = default;

  std::string receive_upto(int size, std::chrono::duration<double> d) override;
  std::string read_line(int max_size, std::chrono::duration<double> d) override;
  int send(const void* data, int size, std::chrono::duration<double> d) override;
  int send(const std::string& s, std::chrono::duration<double> d) override;
  [[nodiscard]] bool is_open() const override { return open_; }
  bool close() override;
  [[nodiscard]] std::optional<int> exit_code() const noexcept override;

private:
  FakeSender& sender_;
  bool open_{true};
};

/** RemoteExec that hands out FakeConnections to sender. */
class FakeRemoteExec : public scpull::scp::RemoteExec {
public:
  explicit FakeRemoteExec(FakeSender& sender) : sender_(sender) {}
  ~FakeRemoteExec() override = default;

  std::unique_ptr<scpull::core::Connection> Exec(const std::string& command) override;

  [[nodiscard]] const std::vector<std::string>& commands() const { return commands_; }
  void set_fail_with(const std::string& message) { fail_with_ = message; }

private:
  FakeSender& sender_;
  std::vector<std::string> commands_;
  std::string fail_with_;
};

#endif

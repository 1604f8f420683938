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
#include "scp_test/fake_sender.h"

#include "core/channel_exceptions.h"
#include "core/strings.h"
#include <algorithm>
#include <memory>
#include <string>

using namespace scpull::core;
using namespace scpull::strings;

void FakeSender::AddSegment(const std::string& data) { held_.push_back(data); }

void FakeSender::AddFile(const std::string& line, const std::string& payload) {
  AddSegment(line);
  AddSegment(payload + std::string(1, '\0'));
}

void FakeSender::Received(const std::string& data) {
  sent_ += data;
  for (const auto ch : data) {
    if (ch != '\0') {
      continue;
    }
    ++acks_;
    if (!held_.empty()) {
      inbound_ += held_.front();
      held_.pop_front();
    }
  }
}

std::string FakeSender::receive_upto(int size) {
  if (inbound_.empty()) {
    if (held_.empty()) {
      return {};
    }
    throw timeout_error(StrCat("sender is waiting for an ack; acks so far: ", acks_));
  }
  const auto n = std::min<std::string::size_type>(
      inbound_.size(), static_cast<std::string::size_type>(std::min(size, max_chunk_)));
  auto s = inbound_.substr(0, n);
  inbound_.erase(0, n);
  return s;
}

std::string FakeSender::read_line(int max_size) {
  if (inbound_.empty() && !held_.empty()) {
    throw timeout_error(StrCat("sender is waiting for an ack; acks so far: ", acks_));
  }
  const auto max = static_cast<std::string::size_type>(max_size);
  auto n = inbound_.find('\n');
  if (n == std::string::npos || n >= max) {
    n = std::min(inbound_.size(), max);
  } else {
    ++n;
  }
  auto s = inbound_.substr(0, n);
  inbound_.erase(0, n);
  return s;
}

std::string FakeConnection::receive_upto(int size, std::chrono::duration<double>) {
  if (!open_) {
    throw channel_closed_error("receive_upto: closed");
  }
  return sender_.receive_upto(size);
}

std::string FakeConnection::read_line(int max_size, std::chrono::duration<double>) {
  if (!open_) {
    throw channel_closed_error("read_line: closed");
  }
  return sender_.read_line(max_size);
}

int FakeConnection::send(const void* data, int size, std::chrono::duration<double> d) {
  return send(std::string(static_cast<const char*>(data), static_cast<std::string::size_type>(size)), d);
}

int FakeConnection::send(const std::string& s, std::chrono::duration<double>) {
  if (!open_) {
    throw channel_closed_error("send: closed");
  }
  sender_.Received(s);
  return static_cast<int>(s.size());
}

bool FakeConnection::close() {
  if (!open_) {
    return false;
  }
  open_ = false;
  sender_.closed();
  return true;
}

std::optional<int> FakeConnection::exit_code() const noexcept {
  if (open_) {
    return std::nullopt;
  }
  return sender_.exit_code();
}

std::unique_ptr<Connection> FakeRemoteExec::Exec(const std::string& command) {
  commands_.push_back(command);
  if (!fail_with_.empty()) {
    throw spawn_error("fake", fail_with_);
  }
  return std::make_unique<FakeConnection>(sender_);
}

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
#include "scp/receiver.h"

#include "core/channel_exceptions.h"
#include "core/file.h"
#include "core/log.h"
#include "core/scope_exit.h"
#include "core/stl.h"
#include "core/strings.h"
#include "scp/paths.h"
#include "scp/scp_exceptions.h"
#include "fmt/format.h"
#include <memory>
#include <string>
#include <utility>

using namespace scpull::core;
using namespace scpull::strings;

namespace scpull::scp {

ScpReceiver::ScpReceiver(std::filesystem::path destination, bool recursive, ScpEvents events)
  : destination_(std::move(destination)), recursive_(recursive), events_(std::move(events)) {
}

ScpReceiver::~ScpReceiver() { Abort(); }

void ScpReceiver::Ack() {
  VLOG(2) << "ack";
  outbound_.push_back('\0');
}

std::string ScpReceiver::Read() {
  if (state_ == ReceiverState::init) {
    Ack();
    state_ = ReceiverState::readline;
  }
  std::string out;
  out.swap(outbound_);
  return out;
}

void ScpReceiver::Write(const std::string& chunk) {
  if (failed_) {
    throw protocol_error("write after a failed transfer");
  }
  if (chunk.empty()) {
    return;
  }
  auto on_error = finally([this] {
    failed_ = true;
    Abort();
  });
  switch (state_) {
  case ReceiverState::init:
    throw protocol_error("data received before the handshake");
  case ReceiverState::readline:
    HandleLine(chunk);
    break;
  case ReceiverState::data:
    HandleData(chunk);
    break;
  default:
    throw protocol_error("invalid state");
  }
  on_error.release();
}

void ScpReceiver::HandleLine(const std::string& chunk) {
  if (chunk.size() > static_cast<std::string::size_type>(kMaxControlLineLength)) {
    throw protocol_error(StrCat("control line longer than ", kMaxControlLineLength, " bytes"));
  }
  if (chunk.back() != '\n') {
    throw protocol_error(StrCat("expected \\n at the end of: ", DebugString(chunk)));
  }
  const auto line = chunk.substr(0, chunk.size() - 1);
  if (line.find('\n') != std::string::npos) {
    throw protocol_error(StrCat("more than one control line in: ", DebugString(chunk)));
  }
  VLOG(1) << "Control line: " << DebugString(line);

  const auto c = ParseControlLine(line);
  switch (c.type) {
  case ControlType::times:
    pending_times_ = c.times;
    break;
  case ControlType::end_directory:
    HandleEndDirectory();
    break;
  case ControlType::directory:
    HandleDirectory(c);
    break;
  case ControlType::file:
    HandleFile(c);
    break;
  case ControlType::error:
    throw remote_error(c.fatal, c.message);
  }
  Ack();
}

std::filesystem::path ScpReceiver::LocalPath(const std::string& name) const {
  if (!recursive_) {
    return destination_;
  }
  return LocalPathFor(destination_, dirs_, name);
}

void ScpReceiver::HandleFile(const ControlLine& c) {
  const auto local = LocalPath(c.name);
  const auto remote = RemotePathFor(dirs_, c.name);
  if (events_.download) {
    events_.download(remote, c.size);
  }
  if (events_.progress) {
    events_.progress(remote, 0, c.size);
  }
  file_ = std::make_unique<ReceiveFile>(local, remote, c.mode, c.size, pending_times_);
  pending_times_.reset();
  file_->Open();
  state_ = ReceiverState::data;
}

void ScpReceiver::HandleDirectory(const ControlLine& c) {
  const auto local = LocalPath(c.name);
  const auto remote = RemotePathFor(dirs_, c.name);
  if (events_.mkdir) {
    events_.mkdir(remote);
  }
  const auto existed = File::is_directory(local);
  if (!File::mkdirs(local)) {
    throw io_error(local.string(), "unable to create directory");
  }
  if (!existed && !File::SetFilePermissions(local, (c.mode & 07777) | 0700)) {
    throw io_error(local.string(), "unable to set directory permissions");
  }
  if (pending_times_) {
    if (!File::set_file_times(local, pending_times_->access_time(),
                              pending_times_->modification_time())) {
      throw io_error(local.string(), "unable to set directory times");
    }
    pending_times_.reset();
  }
  dirs_.push_back(c.name);
  ++stats_.directories;
}

void ScpReceiver::HandleEndDirectory() {
  if (pending_times_) {
    throw protocol_error("time line followed by E");
  }
  if (dirs_.empty()) {
    throw protocol_error("E at the top level");
  }
  dirs_.pop_back();
}

void ScpReceiver::HandleData(const std::string& chunk) {
  if (!file_) {
    throw protocol_error("data received with no open file");
  }
  const auto remaining = file_->remaining();
  const auto size = stl::ssize(chunk);
  if (size <= remaining) {
    file_->WriteChunk(chunk.data(), size);
    if (events_.progress) {
      events_.progress(file_->remote_path(), file_->length(), file_->expected_length());
    }
    return;
  }
  if (size > remaining + 1) {
    throw protocol_error(StrCat(size - remaining - 1, " bytes past the status byte of ",
                                file_->remote_path()));
  }
  if (const auto status = static_cast<unsigned char>(chunk[remaining]); status != 0) {
    throw protocol_error(
        fmt::format("bad status byte {:#04x} after {}", status, file_->remote_path()));
  }
  file_->WriteChunk(chunk.data(), remaining);
  CompleteFile();
}

void ScpReceiver::CompleteFile() {
  auto f = std::move(file_);
  // The data must be on disk with its times set before the sender sees the ack.
  f->Finish();
  state_ = ReceiverState::readline;
  ++stats_.files;
  stats_.bytes += f->length();
  LOG(INFO) << "Received: " << f->remote_path() << " (" << f->length() << " bytes)";
  Ack();
  if (events_.progress) {
    events_.progress(f->remote_path(), f->length(), f->expected_length());
  }
  if (events_.done) {
    events_.done(f->remote_path());
  }
}

void ScpReceiver::Finish() {
  if (failed_) {
    return;
  }
  switch (state_) {
  case ReceiverState::data: {
    const auto message = StrCat("end of stream with ", file_->remaining(),
                                " bytes of ", file_->remote_path(), " outstanding");
    failed_ = true;
    Abort();
    throw channel_closed_error(message);
  }
  case ReceiverState::init:
    LOG(WARNING) << "End of stream before the handshake.";
    break;
  case ReceiverState::readline:
    if (!dirs_.empty()) {
      LOG(WARNING) << "End of stream inside directory: " << JoinStrings(dirs_, "/");
    }
    if (pending_times_) {
      LOG(WARNING) << "End of stream with an unused time line.";
    }
    break;
  }
}

void ScpReceiver::Abort() noexcept {
  if (file_) {
    file_->Abort();
    file_.reset();
  }
}

int64_t ScpReceiver::bytes_wanted() const noexcept {
  if (state_ != ReceiverState::data || !file_) {
    return 0;
  }
  return file_->remaining() + 1;
}

int ScpReceiver::directory_depth() const noexcept { return stl::size_int(dirs_); }

} // namespace scpull::scp

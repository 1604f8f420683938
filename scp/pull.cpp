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

#include "core/connection.h"
#include "core/log.h"
#include "core/scope_exit.h"
#include "scp/control_line.h"
#include "scp/scp_command.h"
#include "scp/scp_exceptions.h"
#include <algorithm>
#include <string>
#include <utility>

using namespace scpull::core;

namespace scpull::scp {

// Largest single read while receiving file data.
static constexpr int64_t kMaxDataRead = 64 * 1024;

Pull::Pull(RemoteExec& exec, PullOptions options)
  : exec_(exec), options_(std::move(options)) {
}

void Pull::add_observer(ScpEvents events) { observers_.emplace_back(std::move(events)); }

ScpEvents Pull::RelayEvents() const {
  ScpEvents relay;
  relay.download = [this](const std::string& path, int64_t size) {
    for (const auto& o : observers_) {
      if (o.download) {
        o.download(path, size);
      }
    }
  };
  relay.mkdir = [this](const std::string& path) {
    for (const auto& o : observers_) {
      if (o.mkdir) {
        o.mkdir(path);
      }
    }
  };
  relay.progress = [this](const std::string& path, int64_t transferred, int64_t total) {
    for (const auto& o : observers_) {
      if (o.progress) {
        o.progress(path, transferred, total);
      }
    }
  };
  relay.done = [this](const std::string& path) {
    for (const auto& o : observers_) {
      if (o.done) {
        o.done(path);
      }
    }
  };
  return relay;
}

void Pull::Start() {
  if (started_) {
    throw scp_error("Pull::Start may only be called once");
  }
  started_ = true;

  const auto command = ScpSourceCommand(options_.scp_program, options_.remote_path,
                                        options_.recursive);
  LOG(INFO) << "Running remote command: " << command;
  auto channel = exec_.Exec(command);

  ScpReceiver receiver(options_.destination, options_.recursive, RelayEvents());
  auto cleanup = finally([&] {
    stats_ = receiver.stats();
    receiver.Abort();
    if (channel->is_open()) {
      channel->close();
    }
  });

  channel->send(receiver.Read(), options_.timeout);
  for (;;) {
    std::string chunk;
    if (receiver.state() == ReceiverState::data) {
      const auto wanted = std::min(receiver.bytes_wanted(), kMaxDataRead);
      chunk = channel->receive_upto(static_cast<int>(wanted), options_.timeout);
    } else {
      chunk = channel->read_line(kMaxControlLineLength, options_.timeout);
    }
    if (chunk.empty()) {
      receiver.Finish();
      break;
    }
    receiver.Write(chunk);
    if (const auto out = receiver.Read(); !out.empty()) {
      channel->send(out, options_.timeout);
    }
  }

  cleanup.release();
  stats_ = receiver.stats();
  channel->close();
  if (const auto code = channel->exit_code(); code && *code != 0) {
    LOG(WARNING) << "Remote command exited with status: " << *code;
  }
  LOG(INFO) << "Pull of " << options_.remote_path << " complete: " << stats_.files
            << " files, " << stats_.directories << " directories, " << stats_.bytes << " bytes";
}

} // namespace scpull::scp

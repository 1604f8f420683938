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
#ifndef INCLUDED_SCP_RECEIVER_H
#define INCLUDED_SCP_RECEIVER_H

#include "scp/control_line.h"
#include "scp/receive_file.h"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace scpull::scp {

enum class ReceiverState { init, readline, data };

/**
 * Lifecycle callbacks.  Paths are the remote paths relative to the pulled
 * root, '/' separated.  Any callback may be left empty.
 */
struct ScpEvents {
  std::function<void(const std::string& path, int64_t size)> download;
  std::function<void(const std::string& path)> mkdir;
  std::function<void(const std::string& path, int64_t transferred, int64_t total)> progress;
  std::function<void(const std::string& path)> done;
};

struct TransferStats {
  int files{0};
  int directories{0};
  int64_t bytes{0};
};

/**
 * Decodes the sender side of an "scp -f" byte stream into local files and
 * directories, producing the acknowledgement bytes the sender waits for.
 *
 * Inbound bytes go to Write(), outbound bytes come from Read().  While in
 * ReceiverState::readline each Write() must be exactly one control line
 * ending in \n.  While in ReceiverState::data a Write() may be any part of
 * the payload, with the status byte at the end of the last one;
 * bytes_wanted() says how much may be written without running past it.
 *
 * Example:
 *   ScpReceiver r("/tmp/in", true, {});
 *   channel.send(r.Read());      // initial ack
 *   r.Write("D0755 0 sub\n");
 *   channel.send(r.Read());      // ack for the line
 *
 * Every error is thrown from Write() or Finish() and leaves the receiver
 * unusable.
 */
class ScpReceiver {
public:
  ScpReceiver(std::filesystem::path destination, bool recursive, ScpEvents events);
  ~ScpReceiver();
  ScpReceiver(const ScpReceiver&) = delete;
  ScpReceiver& operator=(const ScpReceiver&) = delete;

  /** Accepts one inbound chunk. */
  void Write(const std::string& chunk);

  /**
   * Returns, and removes, the bytes queued for the sender.  The first call
   * queues the handshake ack.
   */
  std::string Read();

  /** Signals the end of the inbound stream. */
  void Finish();

  /** Closes any open file.  Used when the pull fails for another reason. */
  void Abort() noexcept;

  [[nodiscard]] ReceiverState state() const noexcept { return state_; }

  /**
   * How many bytes the next Write() may carry while in ReceiverState::data:
   * the rest of the payload plus the status byte.
   */
  [[nodiscard]] int64_t bytes_wanted() const noexcept;

  [[nodiscard]] int directory_depth() const noexcept;
  [[nodiscard]] bool has_pending_times() const noexcept { return pending_times_.has_value(); }
  [[nodiscard]] const TransferStats& stats() const noexcept { return stats_; }
  [[nodiscard]] const std::filesystem::path& destination() const noexcept { return destination_; }

private:
  void HandleLine(const std::string& chunk);
  void HandleData(const std::string& chunk);
  void HandleFile(const ControlLine& c);
  void HandleDirectory(const ControlLine& c);
  void HandleEndDirectory();
  void CompleteFile();
  std::filesystem::path LocalPath(const std::string& name) const;
  void Ack();

  const std::filesystem::path destination_;
  const bool recursive_;
  const ScpEvents events_;
  ReceiverState state_{ReceiverState::init};
  std::vector<std::string> dirs_;
  std::optional<FileTimes> pending_times_;
  std::unique_ptr<ReceiveFile> file_;
  std::string outbound_;
  TransferStats stats_;
  bool failed_{false};
};

} // namespace scpull::scp

#endif

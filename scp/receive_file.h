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
#ifndef INCLUDED_SCP_RECEIVE_FILE_H
#define INCLUDED_SCP_RECEIVE_FILE_H

#include "core/file.h"
#include "scp/control_line.h"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace scpull::scp {

/**
 * The local sink for one file entry, open from its C line until the last
 * payload byte arrived.
 */
class ReceiveFile {
public:
  ReceiveFile(std::filesystem::path local_path, std::string remote_path, int mode,
              int64_t expected_length, std::optional<FileTimes> times);
  ~ReceiveFile() = default;
  ReceiveFile(const ReceiveFile&) = delete;
  ReceiveFile& operator=(const ReceiveFile&) = delete;

  /** Creates or truncates the local file.  Throws io_error. */
  void Open();

  /** Appends size bytes.  Throws io_error. */
  void WriteChunk(const char* chunk, int64_t size);

  /**
   * Flushes the data to disk, closes the file and then applies the file
   * times, if any.  Throws io_error.
   */
  void Finish();

  /** Closes the file without flushing, leaving what was written so far. */
  void Abort() noexcept;

  [[nodiscard]] const std::filesystem::path& local_path() const noexcept { return file_.path(); }
  [[nodiscard]] const std::string& remote_path() const noexcept { return remote_path_; }
  [[nodiscard]] int64_t expected_length() const noexcept { return expected_length_; }
  [[nodiscard]] int64_t length() const noexcept { return length_; }
  [[nodiscard]] int64_t remaining() const noexcept { return expected_length_ - length_; }

private:
  core::File file_;
  std::string remote_path_;
  int mode_;
  int64_t expected_length_;
  int64_t length_{0};
  std::optional<FileTimes> times_;
};

} // namespace scpull::scp

#endif

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
#include "scp/receive_file.h"

#include "core/file.h"
#include "core/log.h"
#include "scp/scp_exceptions.h"
#include <string>
#include <utility>

using namespace scpull::core;

namespace scpull::scp {

ReceiveFile::ReceiveFile(std::filesystem::path local_path, std::string remote_path, int mode,
                         int64_t expected_length, std::optional<FileTimes> times)
  : file_(std::move(local_path)), remote_path_(std::move(remote_path)), mode_(mode),
    expected_length_(expected_length), times_(std::move(times)) {
  VLOG(1) << "ReceiveFile: " << remote_path_ << " -> " << file_.path().string();
}

void ReceiveFile::Open() {
  if (!file_.Open(File::modeWriteOnly | File::modeCreateFile | File::modeTruncate,
                  mode_ & 07777)) {
    throw io_error(file_.full_pathname(), file_.last_error());
  }
}

void ReceiveFile::WriteChunk(const char* chunk, int64_t size) {
  if (size == 0) {
    return;
  }
  if (file_.Write(chunk, size) != size) {
    throw io_error(file_.full_pathname(), file_.last_error());
  }
  length_ += size;
}

void ReceiveFile::Finish() {
  VLOG(3) << "ReceiveFile::Finish " << file_.full_pathname();
  if (!file_.Flush()) {
    const auto error = file_.last_error();
    file_.Close();
    throw io_error(file_.full_pathname(), error);
  }
  file_.Close();
  if (times_ &&
      !File::set_file_times(file_.path(), times_->access_time(), times_->modification_time())) {
    throw io_error(file_.full_pathname(), "unable to set file times");
  }
}

void ReceiveFile::Abort() noexcept {
  if (file_.IsOpen()) {
    VLOG(1) << "ReceiveFile::Abort " << file_.full_pathname();
    file_.Close();
  }
}

} // namespace scpull::scp

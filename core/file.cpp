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
#include "core/file.h"

#include "core/log.h"
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <sys/stat.h>
#include <sys/types.h>
#include <system_error>
#include <unistd.h>
#include <utility>

using namespace std::chrono;
using namespace std::filesystem;

namespace scpull::core {

/////////////////////////////////////////////////////////////////////////////
// Constants

const int File::modeDefault = O_RDWR;
const int File::modeAppend = O_APPEND;
const int File::modeCreateFile = O_CREAT;
const int File::modeReadOnly = O_RDONLY;
const int File::modeReadWrite = O_RDWR;
const int File::modeWriteOnly = O_WRONLY;
const int File::modeTruncate = O_TRUNC;
const int File::modeExclusive = O_EXCL;
const int File::modeUnknown = -1;

const int File::permDefault = 0644;

const int File::invalid_handle = -1;

path FilePath(const path& directory_name, const path& file_name) {
  if (directory_name.empty()) {
    return file_name;
  }
  return directory_name / file_name;
}

/////////////////////////////////////////////////////////////////////////////
// Constructors/Destructors

File::File(std::filesystem::path full_path_name)
  : full_path_name_(std::move(full_path_name)) {
}

File::File(File&& other) noexcept
  : handle_(other.handle_) {
  other.handle_ = invalid_handle;
  full_path_name_.swap(other.full_path_name_);
  error_text_.swap(other.error_text_);
}

File& File::operator=(File&& other) noexcept {
  if (this != &other) {
    Close();
    handle_ = other.handle_;
    full_path_name_.swap(other.full_path_name_);
    error_text_.swap(other.error_text_);
    other.handle_ = invalid_handle;
  }
  return *this;
}

File::~File() {
  if (this->IsOpen()) {
    this->Close();
  }
}

bool File::Open(int file_mode, int permissions) {
  DCHECK_EQ(this->IsOpen(), false) << "File " << full_path_name_ << " is already open.";
  CHECK_NE(file_mode, File::modeUnknown);

  VLOG(5) << "File::Open (before open) " << full_path_name_ << ", access=" << file_mode;
  do {
    handle_ = open(full_path_name_.string().c_str(), file_mode | O_CLOEXEC, permissions);
  } while (handle_ < 0 && errno == EINTR);

  VLOG(3) << "File::Open '" << full_path_name_ << "', access=" << file_mode
          << ", handle=" << handle_;

  if (handle_ == invalid_handle) {
    this->error_text_ = strerror(errno);
  }

  return IsFileHandleValid(handle_);
}

bool File::IsOpen() const noexcept { return IsFileHandleValid(handle_); }

void File::Close() noexcept {
  VLOG(4) << "CLOSE " << full_path_name_ << ", handle=" << handle_;
  if (IsFileHandleValid(handle_)) {
    close(handle_);
    handle_ = invalid_handle;
  }
}

/////////////////////////////////////////////////////////////////////////////
// Member functions

// ReSharper disable once CppMemberFunctionMayBeConst
File::size_type File::Read(void* buffer, File::size_type size) {
  const auto ret = read(handle_, buffer, static_cast<size_t>(size));
  if (ret == -1) {
    error_text_ = strerror(errno);
    LOG(ERROR) << "Read errno: " << errno << " filename: " << full_path_name_
               << " size: " << size << "; " << error_text_;
  }
  return ret;
}

File::size_type File::Write(const void* buffer, File::size_type size) {
  const auto* p = static_cast<const char*>(buffer);
  size_type total = 0;
  while (total < size) {
    const auto r = write(handle_, p + total, static_cast<size_t>(size - total));
    if (r == -1) {
      if (errno == EINTR) {
        continue;
      }
      error_text_ = strerror(errno);
      LOG(ERROR) << "Write errno: " << errno << " filename: " << full_path_name_
                 << " size: " << size << "; " << error_text_;
      return -1;
    }
    total += r;
  }
  return total;
}

bool File::Flush() noexcept {
  if (!IsOpen()) {
    return false;
  }
  if (fsync(handle_) != 0) {
    error_text_ = strerror(errno);
    return false;
  }
  return true;
}

bool File::Exists() const noexcept {
  std::error_code ec;
  return exists(full_path_name_, ec);
}

File::size_type File::length() const noexcept {
  std::error_code ec;
  const auto sz = static_cast<size_type>(file_size(full_path_name_, ec));
  if (ec.value() != 0) {
    return 0;
  }
  return sz;
}

/////////////////////////////////////////////////////////////////////////////
// Static functions

// static
bool File::is_directory(const std::filesystem::path& path) noexcept {
  std::error_code ec;
  return std::filesystem::is_directory(path, ec);
}

static timespec to_timespec(File::time_point t) {
  const auto since_epoch = t.time_since_epoch();
  const auto secs = duration_cast<seconds>(since_epoch);
  timespec ts{};
  ts.tv_sec = static_cast<time_t>(secs.count());
  ts.tv_nsec = static_cast<long>(duration_cast<nanoseconds>(since_epoch - secs).count());
  return ts;
}

// static
bool File::set_file_times(const std::filesystem::path& path, time_point access_time,
                          time_point modification_time) noexcept {
  const timespec times[2] = {to_timespec(access_time), to_timespec(modification_time)};
  if (utimensat(AT_FDCWD, path.string().c_str(), times, 0) != 0) {
    LOG(ERROR) << "utimensat failed on: " << path.string() << "; " << strerror(errno);
    return false;
  }
  return true;
}

bool File::Exists(const std::filesystem::path& p) {
  if (p.empty()) {
    // An empty filename can not exist.
    return false;
  }

  std::error_code ec;
  return exists(p, ec);
}

bool File::SetFilePermissions(const std::filesystem::path& path, int perm) {
  CHECK(!path.empty());
  return chmod(path.string().c_str(), static_cast<mode_t>(perm)) == 0;
}

// static
bool File::IsFileHandleValid(int handle) noexcept { return handle != invalid_handle; }

// static
std::filesystem::path File::current_directory() {
  std::error_code ec;
  return current_path(ec);
}

// static
std::filesystem::path File::absolute(const std::filesystem::path& p) {
  std::error_code ec;
  auto a = std::filesystem::absolute(p, ec);
  if (ec.value() != 0) {
    return p;
  }
  return a;
}

// static
bool File::mkdirs(const std::filesystem::path& p) {
  std::error_code ec;
  if (exists(p, ec)) {
    return is_directory(p);
  }
  if (create_directories(p, ec)) {
    return true;
  }
  return ec.value() == 0;
}

std::ostream& operator<<(std::ostream& os, const File& file) {
  os << file.full_pathname();
  return os;
}

} // namespace scpull::core

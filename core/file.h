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
#ifndef INCLUDED_CORE_FILE_H
#define INCLUDED_CORE_FILE_H

#include <chrono>
#include <filesystem>
#include <ostream>
#include <string>
#include <sys/types.h>

namespace scpull::core {

/**
 * Creates a full std::filesystem::path of directory_name + file_name ensuring that any
 * path separators are added as needed.
 */
std::filesystem::path FilePath(const std::filesystem::path& directory_name,
                               const std::filesystem::path& file_name);

/**
 * File: Provides a high level wrapper for a POSIX file descriptor.
 *
 * Example:
 *   File f("/home/scpull/in/a.txt");
 *   if (!f.Open(File::modeWriteOnly | File::modeCreateFile | File::modeTruncate, 0644)) {
 *     LOG(ERROR) << "unable to create a.txt: " << f.last_error();
 *   }
 *   // No need to close f since when f goes out of scope it'll close automatically.
 */
class File final {
public:
  // Constants
  static const int modeDefault;
  static const int modeUnknown;
  static const int modeAppend;
  static const int modeCreateFile;
  static const int modeReadOnly;
  static const int modeReadWrite;
  static const int modeWriteOnly;
  static const int modeTruncate;
  static const int modeExclusive;

  static const int permDefault;

  static const int invalid_handle;

  using size_type = ssize_t;
  using time_point = std::chrono::system_clock::time_point;

  /** Constructs a file from a path. */
  explicit File(std::filesystem::path full_path_name);
  File(File&& other) noexcept;
  File& operator=(File&& other) noexcept;
  File(const File&) = delete;
  File& operator=(const File&) = delete;

  /** Destructs File. Closes any open file handles. */
  ~File();

  // Public Member functions

  /**
   * Opens the file using the open(2) flags in file_mode.  permissions is only
   * used when modeCreateFile creates a new file, and is subject to the umask.
   */
  bool Open(int file_mode = modeDefault, int permissions = permDefault);
  void Close() noexcept;
  [[nodiscard]] bool IsOpen() const noexcept;

  size_type Read(void* buf, size_type size);
  size_type Write(const void* buffer, size_type count);

  size_type Write(const std::string& s) { return this->Write(s.data(), s.length()); }

  size_type Writeln(const std::string& s) {
    auto ret = this->Write(s);
    ret += this->Write("\n", 1);
    return ret;
  }

  /** Flushes the file contents to stable storage. */
  bool Flush() noexcept;

  [[nodiscard]] size_type length() const noexcept;
  [[nodiscard]] bool Exists() const noexcept;

  /** Returns the file path as a std::string path */
  [[nodiscard]] std::string full_pathname() const noexcept { return full_path_name_.string(); }

  /** Returns the file path as a std::filesystem path */
  [[nodiscard]] const std::filesystem::path& path() const noexcept { return full_path_name_; }

  [[nodiscard]] std::string last_error() const noexcept { return error_text_; }

  // operators
  /** Returns true if the file is open */
  explicit operator bool() const noexcept { return IsOpen(); }
  friend std::ostream& operator<<(std::ostream& os, const File& f);

  // static functions

  [[nodiscard]] static bool Exists(const std::filesystem::path& p);
  static bool SetFilePermissions(const std::filesystem::path& path, int perm);

  [[nodiscard]] static std::filesystem::path current_directory();
  [[nodiscard]] static std::filesystem::path absolute(const std::filesystem::path& p);

  /**
   * Sets both the access and the modification time of path, keeping sub-second
   * precision down to what the filesystem stores.
   */
  static bool set_file_times(const std::filesystem::path& path, time_point access_time,
                             time_point modification_time) noexcept;

  /**
   * Creates the directory {path} and all parent directories needed
   * along the way.
   *
   * Returns true if the new directory is created.
   * Also returns true if there is nothing to do. This is unlike
   * filesystem::mkdir which returns false if {path} already exists.
   */
  static bool mkdirs(const std::filesystem::path& path);

  [[nodiscard]] static bool is_directory(const std::filesystem::path& path) noexcept;

private:
  [[nodiscard]] static bool IsFileHandleValid(int handle) noexcept;

  int handle_{-1};
  std::filesystem::path full_path_name_;
  std::string error_text_;
};

} // namespace scpull::core

#endif

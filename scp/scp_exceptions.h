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
#ifndef INCLUDED_SCP_SCP_EXCEPTIONS_H
#define INCLUDED_SCP_SCP_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace scpull::scp {

/** Base class of every error raised while decoding a transfer. */
struct scp_error : std::runtime_error {
  explicit scp_error(const std::string& message);
};

/** The sender violated the wire grammar or sent something out of sequence. */
struct protocol_error : scp_error {
  explicit protocol_error(const std::string& message);
};

/**
 * The sender reported a failure of its own (a line starting with 0x01 or
 * 0x02).  message() holds the sender's text.
 */
struct remote_error : protocol_error {
  remote_error(bool fatal, const std::string& message);
  [[nodiscard]] bool fatal() const noexcept { return fatal_; }
  [[nodiscard]] const std::string& message() const noexcept { return message_; }

private:
  bool fatal_;
  std::string message_;
};

/** A remote supplied name would escape the destination directory. */
struct path_error : scp_error {
  explicit path_error(const std::string& name);
};

struct timestamp_range_error : scp_error {
  explicit timestamp_range_error(const std::string& line);
};

/** Local filesystem failure while creating or writing an entry. */
struct io_error : scp_error {
  io_error(const std::string& path, const std::string& message);
};

} // namespace scpull::scp

#endif

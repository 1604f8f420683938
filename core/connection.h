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
#ifndef INCLUDED_CORE_CONNECTION_H
#define INCLUDED_CORE_CONNECTION_H

#include <chrono>
#include <optional>
#include <string>

namespace scpull::core {

/**
 * A bidirectional byte channel to a peer.
 *
 * Reads throw timeout_error when nothing arrives within the duration given,
 * and channel_error (or a subclass) on transport failures.  End of stream is
 * not an error: it is reported by returning an empty string.
 */
class Connection {
public:
  Connection() = default;
  virtual ~Connection() = default;

  /**
   * Receives between 1 and size bytes, returning as soon as any data is
   * available.  Returns an empty string on end of stream.
   */
  virtual std::string receive_upto(int size, std::chrono::duration<double> d) = 0;

  /**
   * Reads a line including the trailing \n.  Stops early after max_size
   * bytes, or at end of stream in which case the partial line (possibly
   * empty) is returned.
   */
  virtual std::string read_line(int max_size, std::chrono::duration<double> d) = 0;

  virtual int send(const void* data, int size, std::chrono::duration<double> d) = 0;
  virtual int send(const std::string& s, std::chrono::duration<double> d) = 0;

  [[nodiscard]] virtual bool is_open() const = 0;
  virtual bool close() = 0;

  /** Exit status of the process behind this channel, once known. */
  [[nodiscard]] virtual std::optional<int> exit_code() const noexcept { return std::nullopt; }
};

} // namespace scpull::core

#endif

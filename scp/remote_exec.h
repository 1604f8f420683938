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
#ifndef INCLUDED_SCP_REMOTE_EXEC_H
#define INCLUDED_SCP_REMOTE_EXEC_H

#include "core/connection.h"
#include <memory>
#include <string>

namespace scpull::scp {

/** Runs a command on the remote host. */
class RemoteExec {
public:
  RemoteExec() = default;
  virtual ~RemoteExec() = default;

  /**
   * Starts command and returns a channel bound to its stdin and stdout.
   * Throws core::channel_error (or a subclass) when it can not be started.
   */
  virtual std::unique_ptr<core::Connection> Exec(const std::string& command) = 0;
};

} // namespace scpull::scp

#endif

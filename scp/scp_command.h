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
#ifndef INCLUDED_SCP_SCP_COMMAND_H
#define INCLUDED_SCP_SCP_COMMAND_H

#include <optional>
#include <string>

namespace scpull::scp {

/**
 * Quotes s for a POSIX shell: wraps it in single quotes and replaces each
 * embedded ' with '\''.
 */
std::string QuoteShellArgument(const std::string& s);

/**
 * Returns the command that makes the remote side act as the sender:
 * "<program> -v -f -p [-r] '<remote_path>'".
 */
std::string ScpSourceCommand(const std::string& program, const std::string& remote_path,
                             bool recursive);

/** A remote location of the form [user@]host:path */
struct RemoteLocation {
  // user@host, or just host.
  std::string destination;
  std::string path;
};

/**
 * Splits [user@]host:path.  IPv6 hosts may be bracketed ([::1]:path).
 * A destination starting with '-' is rejected.
 * An empty path means the remote home directory and becomes ".".
 */
std::optional<RemoteLocation> ParseRemoteLocation(const std::string& s);

} // namespace scpull::scp

#endif

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
#include "scp/scp_command.h"

#include "core/strings.h"
#include <optional>
#include <string>

using namespace scpull::strings;

namespace scpull::scp {

std::string QuoteShellArgument(const std::string& s) {
  auto quoted{s};
  StringReplace(&quoted, "'", R"('\'')");
  return StrCat("'", quoted, "'");
}

std::string ScpSourceCommand(const std::string& program, const std::string& remote_path,
                             bool recursive) {
  return StrCat(program, " -v -f -p ", recursive ? "-r " : "", QuoteShellArgument(remote_path));
}

std::optional<RemoteLocation> ParseRemoteLocation(const std::string& s) {
  const auto first_colon = s.find(':');
  if (first_colon == std::string::npos) {
    return std::nullopt;
  }
  const auto at = s.rfind('@', first_colon);
  const auto host_start = at == std::string::npos ? 0 : at + 1;
  RemoteLocation loc;
  std::string::size_type colon;
  if (host_start < s.size() && s[host_start] == '[') {
    const auto close = s.find("]:", host_start);
    if (close == std::string::npos || close == host_start + 1) {
      return std::nullopt;
    }
    colon = close + 1;
    // ssh wants the bare address.
    loc.destination =
        StrCat(s.substr(0, host_start), s.substr(host_start + 1, close - host_start - 1));
  } else {
    colon = s.find(':', host_start);
    if (colon == std::string::npos || colon == host_start) {
      return std::nullopt;
    }
    loc.destination = s.substr(0, colon);
  }
  // ssh would take a destination or host starting with '-' as an option.
  if (loc.destination.front() == '@' || loc.destination.front() == '-' ||
      loc.destination[host_start] == '-') {
    return std::nullopt;
  }
  loc.path = s.substr(colon + 1);
  if (loc.path.empty()) {
    loc.path = ".";
  }
  return loc;
}

} // namespace scpull::scp

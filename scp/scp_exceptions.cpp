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
#include "scp/scp_exceptions.h"

#include "core/strings.h"
#include <string>

using namespace scpull::strings;

namespace scpull::scp {

scp_error::scp_error(const std::string& message)
  : std::runtime_error(message) {
}

protocol_error::protocol_error(const std::string& message)
  : scp_error(StrCat("Protocol error: ", message)) {
}

remote_error::remote_error(bool fatal, const std::string& message)
  : protocol_error(StrCat("remote ", fatal ? "fatal error" : "error", ": ", message)),
    fatal_(fatal), message_(message) {
}

path_error::path_error(const std::string& name)
  : scp_error(StrCat("Invalid path: '", name, "'")) {
}

timestamp_range_error::timestamp_range_error(const std::string& line)
  : scp_error(StrCat("Time out of range: ", line)) {
}

io_error::io_error(const std::string& path, const std::string& message)
  : scp_error(StrCat(path, ": ", message)) {
}

} // namespace scpull::scp

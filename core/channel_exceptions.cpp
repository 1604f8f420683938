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
#include "core/channel_exceptions.h"

#include "core/strings.h"
#include <string>

using namespace scpull::strings;

namespace scpull::core {

channel_error::channel_error(const std::string& message)
  : std::runtime_error(message) {
}

spawn_error::spawn_error(const std::string& program, const std::string& reason)
  : channel_error(StrCat("Unable to start '", program, "': ", reason)) {
}

} // namespace scpull::core

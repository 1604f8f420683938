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
#ifndef INCLUDED_CORE_CHANNEL_EXCEPTIONS_H
#define INCLUDED_CORE_CHANNEL_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace scpull::core {

struct channel_error : std::runtime_error {
  explicit channel_error(const std::string& message);
};

struct channel_closed_error : channel_error {
  explicit channel_closed_error(const std::string& message)
    : channel_error(message) {
  }
};

struct timeout_error : channel_error {
  explicit timeout_error(const std::string& message)
    : channel_error(message) {
  }
};

struct spawn_error : channel_error {
  spawn_error(const std::string& program, const std::string& reason);
};

} // namespace scpull::core

#endif

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
#include "core/version.h"

#include "fmt/format.h"
#include <string>

namespace scpull::core {

std::string compile_datetime() { return fmt::format("{} {}", __DATE__, __TIME__); }

std::string full_version() {
#ifdef SCPULL_FULL_RELEASE
  return SCPULL_FULL_RELEASE;
#else
  return short_version();
#endif
}

std::string short_version() {
#ifdef SCPULL_RELEASE
  return SCPULL_RELEASE;
#else
  return {};
#endif
}

} // namespace scpull::core

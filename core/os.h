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
#ifndef INCLUDED_CORE_OS_H
#define INCLUDED_CORE_OS_H

#include <chrono>
#include <functional>
#include <string>

namespace scpull::os {

// Sleeps for a duration of time d, or until predicate returns true.
// returns the value of predicate.
bool wait_for(const std::function<bool()>& predicate, std::chrono::duration<double> d);

std::string environment_variable(const std::string& variable_name);
bool set_environment_variable(const std::string& variable_name, const std::string& value);

} // namespace scpull::os

#endif

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
#include "core/os.h"

#include <chrono>
#include <cstdlib>
#include <functional>
#include <string>
#include <thread>

using namespace std::chrono;

namespace scpull::os {

bool wait_for(const std::function<bool()>& predicate, duration<double> d) {
  const auto now = steady_clock::now();
  const auto end = now + duration_cast<steady_clock::duration>(d);
  while (!predicate()) {
    if (steady_clock::now() > end) {
      return false;
    }
    std::this_thread::sleep_for(milliseconds(10));
  }
  return true;
}

bool set_environment_variable(const std::string& variable_name, const std::string& value) {
  return setenv(variable_name.c_str(), value.c_str(), 1) == 0;
}

std::string environment_variable(const std::string& variable_name) {
  if (const auto* s = getenv(variable_name.c_str()); s != nullptr) {
    return s;
  }
  return {};
}

} // namespace scpull::os

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
#ifndef INCLUDED_SCP_PATHS_H
#define INCLUDED_SCP_PATHS_H

#include <filesystem>
#include <string>
#include <vector>

namespace scpull::scp {

/**
 * Returns the local path for name inside root/dirs[0]/.../dirs[n].
 *
 * Throws path_error unless the result is a direct child of that directory
 * whose last component is exactly name.
 */
std::filesystem::path LocalPathFor(const std::filesystem::path& root,
                                   const std::vector<std::string>& dirs, const std::string& name);

/** Returns dirs and name joined with '/', the path as the sender sees it. */
std::string RemotePathFor(const std::vector<std::string>& dirs, const std::string& name);

} // namespace scpull::scp

#endif

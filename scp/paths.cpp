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
#include "scp/paths.h"

#include "core/strings.h"
#include "scp/scp_exceptions.h"
#include <filesystem>
#include <string>
#include <vector>

using std::filesystem::path;
using namespace scpull::strings;

namespace scpull::scp {

static path WithoutTrailingSeparator(path p) {
  if (!p.has_filename() && p != p.root_path()) {
    return p.parent_path();
  }
  return p;
}

path LocalPathFor(const path& root, const std::vector<std::string>& dirs,
                  const std::string& name) {
  if (name.empty() || name.find('/') != std::string::npos) {
    throw path_error(name);
  }
  auto parent = root;
  for (const auto& d : dirs) {
    parent /= d;
  }
  parent = WithoutTrailingSeparator(parent.lexically_normal());
  const auto full = (parent / name).lexically_normal();
  if (full.parent_path() != parent || full.filename() != path(name)) {
    throw path_error(RemotePathFor(dirs, name));
  }
  return full;
}

std::string RemotePathFor(const std::vector<std::string>& dirs, const std::string& name) {
  if (dirs.empty()) {
    return name;
  }
  return StrCat(JoinStrings(dirs, "/"), "/", name);
}

} // namespace scpull::scp

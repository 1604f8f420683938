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
#ifndef INCLUDED_CORE_STL_H
#define INCLUDED_CORE_STL_H

#include "core/log.h"
#include <algorithm>
#include <cstddef>
#include <iterator>
#include <limits>
#include <map>
#include <string>
#include <type_traits>

namespace scpull::stl {

template <typename C>
bool contains(C const& container, typename C::const_reference key) {
  return std::find(std::begin(container), std::end(container), key) != std::end(container);
}

template <typename K, typename V, typename C, typename A>
bool contains(std::map<K, V, C, A> const& m, typename std::map<K, V, C, A>::key_type const& key) {
  return m.find(key) != std::end(m);
}

// Partial specialization for maps with const string keys.
template <typename V, typename C, typename A>
bool contains(std::map<const std::string, V, C, A> const& m, const std::string& key) {
  return m.find(key) != std::end(m);
}

// From https://en.cppreference.com/w/cpp/iterator/size (The C++20 version)
template <class C>
constexpr auto ssize(const C& c)
    -> std::common_type_t<std::ptrdiff_t, std::make_signed_t<decltype(c.size())>> {
  using R = std::common_type_t<std::ptrdiff_t, std::make_signed_t<decltype(c.size())>>;
  return static_cast<R>(c.size());
}

template <typename C>
int size_int(const C& c) {
  const auto size = c.size();
  CHECK_LE(size, static_cast<typename C::size_type>(std::numeric_limits<int>::max()));
  return static_cast<int>(size);
}

} // namespace scpull::stl

#endif

#pragma once

#include <cstring>
#include <type_traits>
#include <vector>
#include "util/Assert.hpp"

namespace roxfs { namespace util {

// On-disk structures are byte arrays of boost::endian buffers, so a plain copy decodes them
template<class T>
inline void readT(char const * data, size_t dataSize, size_t offset, T & obj)
{
  static_assert(!std::is_pointer<T>::value, ""); // Protection against pointer reading
  ROXFS_FORMAT_ASSERT(offset <= dataSize && sizeof(T) <= dataSize - offset);
  std::memcpy(&obj, data + offset, sizeof(T));
}

template<class T>
inline void readT(std::vector<char> const & data, size_t offset, T & obj)
{
  readT(data.data(), data.size(), offset, obj);
}

template<class T>
inline T readT(std::vector<char> const & data, size_t offset)
{
  T obj;
  readT(data.data(), data.size(), offset, obj);
  return obj;
}

}}

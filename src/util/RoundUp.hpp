#pragma once

#include <type_traits>

namespace roxfs { namespace util {

template<class T1, class T2>
inline T1 CeilDiv(T1 x, T2 y)
{
  // Works only for positive integers
  static_assert(std::is_integral<T1>::value, "");
  static_assert(std::is_integral<T2>::value, "");

  return (x + y - 1) / y;
}

template<class T1, class T2>
inline T1 RoundUp(T1 x, T2 y)
{
  return CeilDiv(x, y) * y;
}

}}

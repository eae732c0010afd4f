#pragma once

#include <cstdint>
#include <string>

namespace roxfs { namespace util
{

inline uint32_t RotateLeft32(uint32_t value, unsigned shift)
{
  return (value << shift) | (value >> (32 - shift));
}

// Lower case used by ASCII case-insensitive directories, Latin-1 letters included
inline unsigned char FoldAsciiCi(unsigned char c)
{
  if ((c >= 0x41 && c <= 0x5a) || (c >= 0xc0 && c <= 0xd6) || (c >= 0xd8 && c <= 0xde))
    return static_cast<unsigned char>(c + 0x20);
  return c;
}

struct KeepCase
{
  uint32_t operator()(char c) const { return static_cast<unsigned char>(c); }
};

struct FoldCase
{
  uint32_t operator()(char c) const { return FoldAsciiCi(static_cast<unsigned char>(c)); }
};

template<typename Transform>
uint32_t HashBytes(const char * it, const char * end, Transform t)
{
  uint32_t hash = 0;
  for (; end - it >= 4; it += 4)
    hash = (t(it[0]) << 21) ^ (t(it[1]) << 14) ^ (t(it[2]) << 7) ^ t(it[3]) ^ RotateLeft32(hash, 7 * 4);

  switch (end - it)
  {
  case 3:
    return (t(it[0]) << 14) ^ (t(it[1]) << 7) ^ t(it[2]) ^ RotateLeft32(hash, 7 * 3);
  case 2:
    return (t(it[0]) << 7) ^ t(it[1]) ^ RotateLeft32(hash, 7 * 2);
  case 1:
    return t(it[0]) ^ RotateLeft32(hash, 7 * 1);
  default:
    return hash;
  }
}

// Name hash of directory and attribute hash indexes
inline uint32_t HashName(const char * it, const char * end)
{
  return HashBytes(it, end, KeepCase());
}

inline uint32_t HashName(std::string const & name)
{
  return HashName(name.data(), name.data() + name.size());
}

inline uint32_t HashNameAsciiCi(std::string const & name)
{
  return HashBytes(name.data(), name.data() + name.size(), FoldCase());
}

inline bool EqualAsciiCi(std::string const & a, std::string const & b)
{
  if (a.size() != b.size())
    return false;
  for (size_t i = 0; i < a.size(); ++i)
    if (FoldAsciiCi(static_cast<unsigned char>(a[i])) != FoldAsciiCi(static_cast<unsigned char>(b[i])))
      return false;
  return true;
}

}}

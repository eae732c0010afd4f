#pragma once

#include <cstdint>
#include <stddef.h>
#include <boost/crc.hpp>

namespace roxfs { namespace util
{

typedef boost::crc_optimal<32, 0x1EDC6F41, 0xFFFFFFFF, 0xFFFFFFFF, true, true> crc32c_type;

// CRC32c of the buffer with the 4-byte checksum field at 'crcOffset' taken as zero
inline uint32_t ComputeCrc32c(char const * data, size_t size, size_t crcOffset)
{
  static const char zero[4] = {};
  crc32c_type crc;
  crc.process_bytes(data, crcOffset);
  crc.process_bytes(zero, sizeof(zero));
  crc.process_bytes(data + crcOffset + sizeof(zero), size - crcOffset - sizeof(zero));
  return crc.checksum();
}

// Checksums are stored little-endian
inline uint32_t StoredCrc32c(char const * data, size_t crcOffset)
{
  typedef unsigned char uchar;
  char const * p = data + crcOffset;
  return uint32_t(uchar(p[0])) | (uint32_t(uchar(p[1])) << 8)
    | (uint32_t(uchar(p[2])) << 16) | (uint32_t(uchar(p[3])) << 24);
}

inline bool VerifyCrc32c(char const * data, size_t size, size_t crcOffset)
{
  return crcOffset + 4 <= size && StoredCrc32c(data, crcOffset) == ComputeCrc32c(data, size, crcOffset);
}

}}

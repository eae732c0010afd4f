#pragma once

#include <cstdint>

namespace roxfs { namespace util {

// Bit fields packed into a 128-bit word stored as two 64-bit halves.
// Bit 0 is the least significant bit of 'low', bit 127 - the most significant bit of 'high'.
// bitCount is in range [1, 64].

inline uint64_t GetBitField128(uint64_t high, uint64_t low, unsigned firstBit, unsigned bitCount)
{
  uint64_t value;
  if (firstBit >= 64)
    value = high >> (firstBit - 64);
  else if (firstBit == 0)
    value = low;
  else
    value = (low >> firstBit) | (high << (64 - firstBit));
  if (bitCount < 64)
    value &= (UINT64_C(1) << bitCount) - 1;
  return value;
}

inline void SetBitField128(uint64_t & high, uint64_t & low, unsigned firstBit, unsigned bitCount, uint64_t value)
{
  uint64_t const mask = bitCount < 64 ? (UINT64_C(1) << bitCount) - 1 : ~UINT64_C(0);
  value &= mask;
  if (firstBit >= 64)
  {
    high = (high & ~(mask << (firstBit - 64))) | (value << (firstBit - 64));
    return;
  }
  low = (low & ~(mask << firstBit)) | (value << firstBit);
  if (firstBit != 0 && firstBit + bitCount > 64)
  {
    unsigned const shift = 64 - firstBit;
    high = (high & ~(mask >> shift)) | (value >> shift);
  }
}

}}

#pragma once

#include <cstddef>
#include "Common.hpp"

namespace roxfs { namespace format
{

#pragma pack(push,1)

// Header of blocks holding remote attribute values and symlink targets on CRC enabled file systems
struct RemoteBlockHeader
{
  static const uint32_t AttributeMagicValue = 0x5841524d; // "XARM"
  static const uint32_t SymlinkMagicValue = 0x58534c4d;   // "XSLM"

  big_uint32_buf_t magic;
  big_uint32_buf_t offset; // Offset of the payload in the whole value
  big_uint32_buf_t bytes;
  little_uint32_buf_t crc;
  uint8_t uuid[UuidSize];
  big_uint64_buf_t owner;
  big_uint64_buf_t blockNumber;
  big_uint64_buf_t lsn;
};

static const size_t RemoteBlockCrcOffset = 12;

static_assert(sizeof(RemoteBlockHeader) == 56, "");

#pragma pack(pop)

}}

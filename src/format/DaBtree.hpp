#pragma once

#include <cstddef>
#include "Common.hpp"

namespace roxfs { namespace format
{

#pragma pack(push,1)

// Common header of hash-indexed btree blocks (directory leaves and nodes, attribute leaves and nodes)
struct DaBlockInfo
{
  big_uint32_buf_t forward;
  big_uint32_buf_t back;
  big_uint16_buf_t magic;
  big_uint16_buf_t pad;
};

struct Da3BlockInfo: DaBlockInfo
{
  little_uint32_buf_t crc;
  big_uint64_buf_t blockNumber;
  big_uint64_buf_t lsn;
  uint8_t uuid[UuidSize];
  big_uint64_buf_t owner;
};

struct DaNodeHeader
{
  static const uint16_t MagicValue = 0xfebe;
  static const uint16_t MagicValueV5 = 0x3ebe;

  DaBlockInfo info;
  big_uint16_buf_t count;
  big_uint16_buf_t level;
};

struct Da3NodeHeader
{
  Da3BlockInfo info;
  big_uint16_buf_t count;
  big_uint16_buf_t level;
  big_uint32_buf_t pad;
};

struct DaNodeEntry
{
  big_uint32_buf_t hashValue; // Highest hash in the child subtree
  big_uint32_buf_t before;    // Child block within the fork
};

static const size_t Da3BlockCrcOffset = 12;
static const unsigned MaxDaLevels = 5;

static_assert(sizeof(DaBlockInfo) == 12, "");
static_assert(sizeof(Da3BlockInfo) == 56, "");
static_assert(sizeof(DaNodeHeader) == 16, "");
static_assert(sizeof(Da3NodeHeader) == 64, "");

#pragma pack(pop)

}}

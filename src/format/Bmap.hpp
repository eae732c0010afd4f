#pragma once

#include <cstddef>
#include "Common.hpp"

namespace roxfs { namespace format
{

#pragma pack(push,1)

// Extent record, 128 bits:
//   bit 127       - unwritten flag
//   bits 73..126  - logical file offset in blocks
//   bits 21..72   - starting filesystem block
//   bits 0..20    - length in blocks
struct BmbtRecord
{
  static const unsigned UnwrittenBit = 127;
  static const unsigned FileOffsetFirstBit = 73;
  static const unsigned FileOffsetBits = 54;
  static const unsigned StartBlockFirstBit = 21;
  static const unsigned StartBlockBits = 52;
  static const unsigned BlockCountFirstBit = 0;
  static const unsigned BlockCountBits = 21;

  big_uint64_buf_t high;
  big_uint64_buf_t low;
};

typedef big_uint64_buf_t BmbtKey;
typedef big_uint64_buf_t BmbtPointer;

// Root of the extent btree stored in inode fork. 'maxRecords' keys are
// followed by 'maxRecords' pointers, maxRecords depends on fork size.
struct BmdrHeader
{
  big_uint16_buf_t level;
  big_uint16_buf_t recordCount;
};

struct BtreeLongBlockHeader
{
  static const uint32_t MagicValue = 0x424d4150;   // "BMAP"
  static const uint32_t MagicValueV5 = 0x424d4133; // "BMA3"
  static const uint64_t NullBlock = ~UINT64_C(0);

  big_uint32_buf_t magic;
  big_uint16_buf_t level;
  big_uint16_buf_t recordCount;
  big_uint64_buf_t leftSibling;
  big_uint64_buf_t rightSibling;
};

struct BtreeLongBlockHeaderV5: BtreeLongBlockHeader
{
  big_uint64_buf_t blockNumber;
  big_uint64_buf_t lsn;
  uint8_t uuid[UuidSize];
  big_uint64_buf_t owner;
  little_uint32_buf_t crc;
  big_uint32_buf_t pad;
};

static const size_t BtreeLongBlockCrcOffset = 64;
static const unsigned MaxBmbtLevels = 9;

static_assert(sizeof(BmbtRecord) == 16, "");
static_assert(sizeof(BtreeLongBlockHeader) == 24, "");
static_assert(sizeof(BtreeLongBlockHeaderV5) == 72, "");

#pragma pack(pop)

}}

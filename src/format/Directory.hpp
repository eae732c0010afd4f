#pragma once

#include <cstddef>
#include "DaBtree.hpp"

namespace roxfs { namespace format
{

#pragma pack(push,1)

// Short form directory stored in the inode literal area:
//   header, parent inode (4 or 8 bytes), entries
// Entry: nameLength, offset (2 bytes), name, [file type], inode (4 or 8 bytes)
struct Dir2SfHeader
{
  uint8_t count;
  uint8_t count8; // Non-zero if inode numbers are 8 bytes long
};

struct Dir2SfEntryHeader
{
  uint8_t nameLength;
  big_uint16_buf_t offset;
};

struct Dir2DataFree
{
  big_uint16_buf_t offset;
  big_uint16_buf_t length;
};

struct Dir2DataHeader
{
  static const uint32_t BlockMagicValue = 0x58443242; // "XD2B"
  static const uint32_t DataMagicValue = 0x58443244;  // "XD2D"

  big_uint32_buf_t magic;
  Dir2DataFree bestFree[3];
};

struct Dir3BlockHeader
{
  static const uint32_t BlockMagicValue = 0x58444233; // "XDB3"
  static const uint32_t DataMagicValue = 0x58444433;  // "XDD3"
  static const uint32_t FreeMagicValue = 0x58444633;  // "XDF3"

  big_uint32_buf_t magic;
  little_uint32_buf_t crc;
  big_uint64_buf_t blockNumber;
  big_uint64_buf_t lsn;
  uint8_t uuid[UuidSize];
  big_uint64_buf_t owner;
};

struct Dir3DataHeader
{
  Dir3BlockHeader header;
  Dir2DataFree bestFree[3];
  big_uint32_buf_t pad;
};

// Data entry: header, name, [file type], padding to 8 bytes, 2 bytes tag (own offset in the block)
struct Dir2DataEntryHeader
{
  big_uint64_buf_t inode;
  uint8_t nameLength;
};

// Unused space: freeTag, length, ..., 2 bytes tag
struct Dir2DataUnused
{
  static const uint16_t FreeTagValue = 0xffff;

  big_uint16_buf_t freeTag;
  big_uint16_buf_t length;
};

struct Dir2LeafEntry
{
  big_uint32_buf_t hashValue;
  big_uint32_buf_t address; // Byte offset of data entry divided by 8, 0 for stale entries
};

// At the very end of a single block directory, preceded by 'count' leaf entries
struct Dir2BlockTail
{
  big_uint32_buf_t count;
  big_uint32_buf_t stale;
};

struct Dir2LeafHeader
{
  static const uint16_t Leaf1MagicValue = 0xd2f1;
  static const uint16_t LeafNMagicValue = 0xd2ff;

  DaBlockInfo info;
  big_uint16_buf_t count;
  big_uint16_buf_t stale;
};

struct Dir3LeafHeader
{
  static const uint16_t Leaf1MagicValue = 0x3df1;
  static const uint16_t LeafNMagicValue = 0x3dff;

  Da3BlockInfo info;
  big_uint16_buf_t count;
  big_uint16_buf_t stale;
  big_uint32_buf_t pad;
};

// At the very end of a single leaf block, preceded by 'bestCount' 16-bit best free values
struct Dir2LeafTail
{
  big_uint32_buf_t bestCount;
};

static const uint32_t Dir2FreeMagicValue = 0x58443246; // "XD2F"

static const unsigned Dir2DataAlignLog = 3;
static const uint64_t Dir2LeafOffset = UINT64_C(1) << 35;
static const uint64_t Dir2FreeOffset = UINT64_C(1) << 36;
static const uint32_t Dir2NullDataAddress = 0;
static const uint8_t Dir3FileTypeWhiteout = 8;

static const size_t Dir3DataCrcOffset = 4;

static_assert(sizeof(Dir2SfEntryHeader) == 3, "");
static_assert(sizeof(Dir2DataHeader) == 16, "");
static_assert(sizeof(Dir3BlockHeader) == 48, "");
static_assert(sizeof(Dir3DataHeader) == 64, "");
static_assert(sizeof(Dir2DataEntryHeader) == 9, "");
static_assert(sizeof(Dir2LeafHeader) == 16, "");
static_assert(sizeof(Dir3LeafHeader) == 64, "");

#pragma pack(pop)

}}

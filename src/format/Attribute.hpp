#pragma once

#include <cstddef>
#include "DaBtree.hpp"

namespace roxfs { namespace format
{

#pragma pack(push,1)

enum AttributeFlags: uint8_t
{
  AttributeLocal = 1 << 0,
  AttributeRoot = 1 << 1,   // "trusted." namespace
  AttributeSecure = 1 << 2, // "security." namespace
  AttributeParent = 1 << 3, // Parent pointer, not an extended attribute
  AttributeIncomplete = 1 << 7,

  AttributeNamespaceMask = AttributeRoot | AttributeSecure | AttributeParent
};

struct AttrShortformHeader
{
  big_uint16_buf_t totalSize;
  uint8_t count;
  uint8_t pad;
};

// Followed by name and value
struct AttrShortformEntry
{
  uint8_t nameLength;
  uint8_t valueLength;
  uint8_t flags;
};

struct AttrLeafMap
{
  big_uint16_buf_t base;
  big_uint16_buf_t size;
};

struct AttrLeafHeader
{
  static const uint16_t MagicValue = 0xfbee;

  DaBlockInfo info;
  big_uint16_buf_t count;
  big_uint16_buf_t usedBytes;
  big_uint16_buf_t firstUsed;
  uint8_t holes;
  uint8_t pad1;
  AttrLeafMap freeMap[3];
};

struct Attr3LeafHeader
{
  static const uint16_t MagicValue = 0x3bee;

  Da3BlockInfo info;
  big_uint16_buf_t count;
  big_uint16_buf_t usedBytes;
  big_uint16_buf_t firstUsed;
  uint8_t holes;
  uint8_t pad1;
  AttrLeafMap freeMap[3];
  big_uint32_buf_t pad2;
};

struct AttrLeafEntry
{
  big_uint32_buf_t hashValue;
  big_uint16_buf_t nameIndex; // Offset of the name structure in the block
  uint8_t flags;
  uint8_t pad;
};

// Followed by name and value
struct AttrLeafNameLocal
{
  big_uint16_buf_t valueLength;
  uint8_t nameLength;
};

// Followed by name, value is stored in separate blocks starting at 'valueBlock'
struct AttrLeafNameRemote
{
  big_uint32_buf_t valueBlock;
  big_uint32_buf_t valueLength;
  uint8_t nameLength;
};

static_assert(sizeof(AttrShortformHeader) == 4, "");
static_assert(sizeof(AttrShortformEntry) == 3, "");
static_assert(sizeof(AttrLeafHeader) == 32, "");
static_assert(sizeof(Attr3LeafHeader) == 80, "");
static_assert(sizeof(AttrLeafEntry) == 8, "");
static_assert(sizeof(AttrLeafNameLocal) == 3, "");
static_assert(sizeof(AttrLeafNameRemote) == 9, "");

#pragma pack(pop)

}}
